#pragma once

#include <cstddef>
#include <string_view>

namespace resolver::util {

constexpr std::size_t kMaxIdBytes = 256;

/*
  Record and golden record ids are opaque strings.

  Accepted: non-empty, at most kMaxIdBytes bytes, no ASCII control characters.
  Throws InvalidArgument naming `what` otherwise.
*/
void ValidateId(std::string_view id, std::string_view what);

} // namespace resolver::util
