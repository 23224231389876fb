#include "term_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace resolver::similarity {

void TermStatistics::AddDocument(const std::vector<std::string>& tokens) {
  ++documents_;
  const std::set<std::string> distinct(tokens.begin(), tokens.end());
  for (const auto& token : distinct) {
    ++document_frequency_[token];
  }
}

double TermStatistics::Idf(const std::string& term) const {
  std::size_t df = 0;
  if (auto it = document_frequency_.find(term); it != document_frequency_.end()) {
    df = it->second;
  }
  return std::log((1.0 + static_cast<double>(documents_)) / (1.0 + static_cast<double>(df))) + 1.0;
}

TermVector TermStatistics::Vectorize(const std::vector<std::string>& tokens) const {
  std::map<std::string, std::size_t> counts;
  for (const auto& token : tokens) ++counts[token];

  TermVector vector;
  vector.weights.reserve(counts.size());
  double squared = 0.0;
  for (const auto& [term, count] : counts) {
    const double weight = static_cast<double>(count) * Idf(term);
    vector.weights.emplace_back(term, weight);
    squared += weight * weight;
  }
  vector.norm = std::sqrt(squared);
  return vector;
}

double CosineSimilarity(const TermVector& a, const TermVector& b) {
  if (a.empty() || b.empty() || a.norm == 0.0 || b.norm == 0.0) return 0.0;

  // merge over the sorted terms so the summation order is the same for (a, b) and (b, a)
  double      dot = 0.0;
  std::size_t i   = 0;
  std::size_t j   = 0;
  while (i < a.weights.size() && j < b.weights.size()) {
    const int cmp = a.weights[i].first.compare(b.weights[j].first);
    if (cmp == 0) {
      dot += a.weights[i].second * b.weights[j].second;
      ++i;
      ++j;
    } else if (cmp < 0) {
      ++i;
    } else {
      ++j;
    }
  }
  return std::clamp(dot / (a.norm * b.norm), 0.0, 1.0);
}

} // namespace resolver::similarity
