#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace resolver::similarity {

/*
  String similarity primitives used by alias resolution and pair scoring.

  Every similarity is symmetric and lies in [0, 1]. Inputs are compared
  byte-wise; callers normalize first.
*/

constexpr double      kJaroWinklerPrefixScale = 0.1;
constexpr std::size_t kJaroWinklerMaxPrefix   = 4;

double Jaro(std::string_view a, std::string_view b);
double JaroWinkler(std::string_view a, std::string_view b);

std::size_t LevenshteinDistance(std::string_view a, std::string_view b);

// 1 - distance / max(len). Two empty strings are identical.
double LevenshteinSimilarity(std::string_view a, std::string_view b);

// |A n B| / |A u B| over the distinct tokens. 0 when both are empty.
double Jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b);

} // namespace resolver::similarity
