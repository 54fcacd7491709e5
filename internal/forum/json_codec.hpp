#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace cadence::forum {

// Request bodies use lowerCamel JSON names and omit empty fields.
inline std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw util::PublishError("Failed to encode request: " + std::string(status.message()));
  }
  return json;
}

// Responses may carry more fields than we model.
template <typename Message>
Message FromJson(const std::string& body, std::string_view what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(body, &message, options);
  if (!status.ok()) {
    throw util::PublishError("Malformed " + std::string(what) + " response: " + std::string(status.message()));
  }
  return message;
}

} // namespace cadence::forum
