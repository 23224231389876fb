#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace resolver::similarity {

// Sparse TF-IDF vector sorted by term, with its cached L2 norm.
struct TermVector {
  std::vector<std::pair<std::string, double>> weights;
  double                                      norm = 0.0;

  bool empty() const {
    return weights.empty();
  }
};

/*
  Corpus document frequencies for TF-IDF.

  Built once per run over the title+description tokens of every source record,
  then read concurrently by scorers. Smoothed IDF: ln((1 + N) / (1 + df)) + 1.
*/
class TermStatistics {
 public:
  // Each distinct token of the document counts once toward its df.
  void AddDocument(const std::vector<std::string>& tokens);

  double Idf(const std::string& term) const;

  // Raw term counts weighted by Idf.
  TermVector Vectorize(const std::vector<std::string>& tokens) const;

  std::size_t documents() const {
    return documents_;
  }

  std::size_t vocabulary_size() const {
    return document_frequency_.size();
  }

 private:
  std::size_t                                  documents_ = 0;
  std::unordered_map<std::string, std::size_t> document_frequency_;
};

double CosineSimilarity(const TermVector& a, const TermVector& b);

} // namespace resolver::similarity
