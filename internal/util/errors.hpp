#pragma once

#include <stdexcept>
#include <string>

namespace resolver::util {

/*
  Central error types.

  Thrown across the engine and query API; resolverctl maps them to exit codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Source read or sink write failure. Fatal for the run that hit it.
class BackendError : public std::runtime_error {
 public:
  explicit BackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace resolver::util
