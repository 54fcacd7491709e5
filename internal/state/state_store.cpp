#include "state_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace cadence::state {

using cadence::util::ConfigurationError;

namespace {

void EnsureParent(const std::filesystem::path& target) {
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }
}

} // namespace

StateStore::StateStore(std::string path) : path_(std::move(path)) {
}

bool StateStore::Exists() const {
  return std::filesystem::exists(path_);
}

cadence::state::v1::ForumState StateStore::Load() const {
  cadence::state::v1::ForumState state;
  if (!Exists()) {
    state.set_schema_version(kSchemaVersion);
    return state;
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw ConfigurationError("cannot read forum state " + path_);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &state, options);
  if (!status.ok()) {
    throw ConfigurationError("Invalid forum state " + path_ + ": " + std::string(status.message()));
  }

  // files written before versioning carry no schema_version
  if (state.schema_version() == 0) {
    state.set_schema_version(kSchemaVersion);
  }
  if (state.schema_version() > kSchemaVersion) {
    throw ConfigurationError("forum state " + path_ + " has schema_version " + std::to_string(state.schema_version()) +
                             ", newest supported is " + std::to_string(kSchemaVersion));
  }
  return state;
}

void StateStore::Save(const cadence::state::v1::ForumState& state) const {
  cadence::state::v1::ForumState copy = state;
  copy.set_schema_version(kSchemaVersion);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(copy, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize forum state: " + std::string(status.message()));
  }

  const std::filesystem::path target(path_);
  EnsureParent(target);

  const auto    tmp = target.string() + ".tmp";
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + tmp + " for writing");
  }
  out << json;
  out.close();
  if (!out) {
    throw std::runtime_error("failed writing " + tmp);
  }

  std::filesystem::rename(tmp, target);
}

PostLog::PostLog(std::string path) : path_(std::move(path)) {
}

void PostLog::Append(const cadence::state::v1::PostLogEntry& entry) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string line;
  auto        status = google::protobuf::util::MessageToJsonString(entry, &line, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize post log entry: " + std::string(status.message()));
  }

  EnsureParent(std::filesystem::path(path_));
  std::ofstream out(path_, std::ios::binary | std::ios::app);
  if (!out) {
    throw std::runtime_error("cannot open " + path_ + " for appending");
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    throw std::runtime_error("failed appending to " + path_);
  }
}

std::size_t PostLog::CountEntries() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) return 0;

  std::size_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") != std::string::npos) ++count;
  }
  return count;
}

} // namespace cadence::state
