#pragma once

#include <string>
#include <utility>

namespace cadence::db {

/*
  Outcome of a bookkeeping write.

  AlreadyExists means the ledger key was executed before; the ledger treats
  it as success. Backend failures arrive as Busy, IOError or InternalError
  with the backend's message.
*/
enum class ErrorCode {
  OK = 0,
  AlreadyExists,
  Busy,
  IOError,
  InternalError,
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace cadence::db
