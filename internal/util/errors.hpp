#pragma once

#include <stdexcept>
#include <string>

namespace cadence::util {

/*
  Central error types.

  Per-record errors (everything except ConfigurationError) are caught at the
  dispatch boundary, logged, and turn the record into a skip.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownAccount : public std::runtime_error {
 public:
  explicit UnknownAccount(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingCredential : public std::runtime_error {
 public:
  explicit MissingCredential(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownCommunity : public std::runtime_error {
 public:
  explicit UnknownCommunity(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnresolvedReference : public std::runtime_error {
 public:
  explicit UnresolvedReference(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Any failed call against the forum API.
class PublishError : public std::runtime_error {
 public:
  explicit PublishError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ApiError : public PublishError {
 public:
  ApiError(const std::string& msg, long status_code, std::string body)
      : PublishError(msg), status_code_(status_code), body_(std::move(body)) {
  }

  long StatusCode() const {
    return status_code_;
  }

  const std::string& Body() const {
    return body_;
  }

 private:
  long        status_code_;
  std::string body_;
};

class AuthenticationError : public PublishError {
 public:
  explicit AuthenticationError(const std::string& msg) : PublishError(msg) {
  }
};

} // namespace cadence::util
