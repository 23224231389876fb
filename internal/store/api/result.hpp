#pragma once

#include <string>
#include <utility>

namespace resolver::store {

/*
  Portable backend result codes.

  Every backend translates its own errors into these. The engine never
  depends on sqlite/pqxx/arrow error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ErrorCodeName(ErrorCode code);

// Throws util::BackendError carrying `context` when the result is an error.
void ThrowIfError(const Result& result, const std::string& context);

} // namespace resolver::store
