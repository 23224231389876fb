#include "hash.hpp"

namespace resolver::util {

std::uint64_t Fnv1a64(std::string_view data, std::uint64_t seed) {
  std::uint64_t hash = seed;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string ToHex64(std::uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[value & 0x0F];
    value >>= 4;
  }
  return out;
}

} // namespace resolver::util
