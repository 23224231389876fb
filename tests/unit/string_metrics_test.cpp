#include "internal/similarity/string_metrics.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/similarity/term_statistics.hpp"

namespace {

using namespace resolver::similarity;

bool Near(double a, double b, double eps = 1e-3) {
  return std::fabs(a - b) < eps;
}

void TestJaroWinklerReferenceValues() {
  assert(Near(Jaro("MARTHA", "MARHTA"), 0.9444));
  assert(Near(JaroWinkler("MARTHA", "MARHTA"), 0.9611));
  assert(Near(JaroWinkler("DWAYNE", "DUANE"), 0.84));
  assert(Near(JaroWinkler("DIXON", "DICKSONX"), 0.8133));
  assert(JaroWinkler("ABC", "ABC") == 1.0);
  assert(JaroWinkler("ABC", "XYZ") == 0.0);
  assert(JaroWinkler("", "") == 1.0);
  assert(JaroWinkler("", "A") == 0.0);
}

void TestMetricsAreSymmetric() {
  const std::vector<std::pair<std::string, std::string>> pairs = {
      {"AGM14NV4123414111", "14NV4123414111"}, {"ABCA", "BAAC"}, {"CRATE", "TRACE"}, {"3M", "3M COMPANY"}};
  for (const auto& [a, b] : pairs) {
    assert(JaroWinkler(a, b) == JaroWinkler(b, a));
    assert(LevenshteinDistance(a, b) == LevenshteinDistance(b, a));
    assert(LevenshteinSimilarity(a, b) == LevenshteinSimilarity(b, a));
    assert(JaroWinkler(a, b) >= 0.0 && JaroWinkler(a, b) <= 1.0);
  }
}

void TestLevenshtein() {
  assert(LevenshteinDistance("KITTEN", "SITTING") == 3);
  assert(LevenshteinDistance("", "ABC") == 3);
  assert(LevenshteinDistance("SAME", "SAME") == 0);
  assert(Near(LevenshteinSimilarity("KITTEN", "SITTING"), 1.0 - 3.0 / 7.0));
  assert(LevenshteinSimilarity("", "") == 1.0);
  assert(Near(LevenshteinSimilarity("AGM14NV4123414111", "14NV4123414111"), 1.0 - 3.0 / 17.0));
}

void TestJaccardUsesDistinctTokens() {
  assert(Jaccard({"a", "b", "b"}, {"b", "c"}) == 1.0 / 3.0);
  assert(Jaccard({}, {}) == 0.0);
  assert(Jaccard({"a"}, {}) == 0.0);
  assert(Jaccard({"x", "y"}, {"y", "x"}) == 1.0);
}

void TestTfIdfCosine() {
  TermStatistics terms;
  terms.AddDocument({"vinyl", "electrical", "tape"});
  terms.AddDocument({"vinyl", "electrical", "tape", "black"});
  terms.AddDocument({"circuit", "breaker"});
  assert(terms.documents() == 3);
  assert(terms.vocabulary_size() == 6);

  // rarer terms weigh more
  assert(terms.Idf("breaker") > terms.Idf("tape"));
  assert(terms.Idf("unseen") > terms.Idf("breaker"));

  const auto tape_a  = terms.Vectorize({"vinyl", "electrical", "tape"});
  const auto tape_b  = terms.Vectorize({"black", "vinyl", "electrical", "tape"});
  const auto breaker = terms.Vectorize({"circuit", "breaker"});

  assert(Near(CosineSimilarity(tape_a, tape_a), 1.0));
  assert(CosineSimilarity(tape_a, tape_b) > 0.5);
  assert(CosineSimilarity(tape_a, tape_b) == CosineSimilarity(tape_b, tape_a));
  assert(CosineSimilarity(tape_a, breaker) == 0.0);
  assert(CosineSimilarity(tape_a, terms.Vectorize({})) == 0.0);
}

} // namespace

int main() {
  TestJaroWinklerReferenceValues();
  TestMetricsAreSymmetric();
  TestLevenshtein();
  TestJaccardUsesDistinctTokens();
  TestTfIdfCosine();

  std::cout << "string_metrics_test: pass\n";
  return 0;
}
