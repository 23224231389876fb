#include "result.hpp"

#include "internal/util/errors.hpp"

namespace resolver::store {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + " (" + ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw util::BackendError(message);
}

} // namespace resolver::store
