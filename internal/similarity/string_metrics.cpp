#include "string_metrics.hpp"

#include <algorithm>
#include <set>

namespace resolver::similarity {
namespace {

double JaroOrdered(std::string_view a, std::string_view b) {
  if (a.empty() && b.empty()) return 1.0;
  if (a.empty() || b.empty()) return 0.0;

  const std::size_t window = std::max<std::size_t>(std::max(a.size(), b.size()) / 2, 1) - 1;

  std::vector<bool> a_matched(a.size(), false);
  std::vector<bool> b_matched(b.size(), false);

  std::size_t matches = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const std::size_t lo = i > window ? i - window : 0;
    const std::size_t hi = std::min(i + window + 1, b.size());
    for (std::size_t j = lo; j < hi; ++j) {
      if (b_matched[j] || a[i] != b[j]) continue;
      a_matched[i] = true;
      b_matched[j] = true;
      ++matches;
      break;
    }
  }
  if (matches == 0) return 0.0;

  std::size_t half_transpositions = 0;
  std::size_t k                   = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!a_matched[i]) continue;
    while (!b_matched[k]) ++k;
    if (a[i] != b[k]) ++half_transpositions;
    ++k;
  }

  const double m = static_cast<double>(matches);
  const double t = static_cast<double>(half_transpositions) / 2.0;
  return (m / static_cast<double>(a.size()) + m / static_cast<double>(b.size()) + (m - t) / m) / 3.0;
}

} // namespace

double Jaro(std::string_view a, std::string_view b) {
  // greedy matching is order dependent; fix the order so the metric is symmetric
  return a <= b ? JaroOrdered(a, b) : JaroOrdered(b, a);
}

double JaroWinkler(std::string_view a, std::string_view b) {
  const double jaro = Jaro(a, b);

  std::size_t prefix = 0;
  const auto  limit  = std::min({a.size(), b.size(), kJaroWinklerMaxPrefix});
  while (prefix < limit && a[prefix] == b[prefix]) ++prefix;

  return std::min(1.0, jaro + static_cast<double>(prefix) * kJaroWinklerPrefixScale * (1.0 - jaro));
}

std::size_t LevenshteinDistance(std::string_view a, std::string_view b) {
  if (a.size() < b.size()) std::swap(a, b);
  if (b.empty()) return a.size();

  std::vector<std::size_t> previous(b.size() + 1);
  std::vector<std::size_t> current(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) previous[j] = j;

  for (std::size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      current[j]                     = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
    }
    std::swap(previous, current);
  }
  return previous[b.size()];
}

double LevenshteinSimilarity(std::string_view a, std::string_view b) {
  const auto longest = std::max(a.size(), b.size());
  if (longest == 0) return 1.0;
  return 1.0 - static_cast<double>(LevenshteinDistance(a, b)) / static_cast<double>(longest);
}

double Jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  const std::set<std::string> left(a.begin(), a.end());
  const std::set<std::string> right(b.begin(), b.end());
  if (left.empty() && right.empty()) return 0.0;

  std::size_t shared = 0;
  for (const auto& token : left) {
    if (right.count(token)) ++shared;
  }
  const auto total = left.size() + right.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(total);
}

} // namespace resolver::similarity
