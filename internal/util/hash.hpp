#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace resolver::util {

constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime       = 0x100000001b3ULL;

// 64-bit FNV-1a. Continue a running hash by passing the previous value as seed.
std::uint64_t Fnv1a64(std::string_view data, std::uint64_t seed = kFnvOffsetBasis);

// Fixed width, 16 lowercase hex digits.
std::string ToHex64(std::uint64_t value);

} // namespace resolver::util
