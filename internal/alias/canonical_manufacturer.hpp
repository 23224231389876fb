#pragma once

#include <string>
#include <string_view>

namespace resolver::alias {

enum class ResolutionMethod {
  kEmpty,       // blank input
  kAliasTable,  // exact alias or canonical hit
  kFuzzy,       // Jaro-Winkler match against a canonical identity
  kSelf,        // no mapping; normalized input is its own identity
};

struct CanonicalManufacturer {
  std::string      identity;
  ResolutionMethod method = ResolutionMethod::kEmpty;
  double           score  = 0.0;  // fuzzy similarity, 1.0 for table hits

  bool empty() const {
    return identity.empty();
  }
};

inline std::string_view MethodName(ResolutionMethod method) {
  switch (method) {
    case ResolutionMethod::kEmpty:
      return "empty";
    case ResolutionMethod::kAliasTable:
      return "alias_table";
    case ResolutionMethod::kFuzzy:
      return "fuzzy";
    case ResolutionMethod::kSelf:
      return "self";
  }
  return "unknown";
}

} // namespace resolver::alias
