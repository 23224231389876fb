#include "ids.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace resolver::util {

void ValidateId(std::string_view id, std::string_view what) {
  if (id.empty()) {
    throw InvalidArgument(std::string(what) + ": id must not be empty");
  }
  if (id.size() > kMaxIdBytes) {
    throw InvalidArgument(std::string(what) + ": id exceeds " + std::to_string(kMaxIdBytes) + " bytes");
  }
  for (unsigned char c : id) {
    if (c < 0x20 || c == 0x7F) {
      throw InvalidArgument(std::string(what) + ": id contains control characters");
    }
  }
}

} // namespace resolver::util
