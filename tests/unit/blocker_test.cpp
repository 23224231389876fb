#include "internal/blocking/blocker.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace resolver::blocking;
using resolver::features::RecordFeatures;

RecordFeatures Feature(std::string id, std::string manufacturer, std::optional<std::string> unspsc = std::nullopt,
                       std::optional<std::string> gtin = std::nullopt) {
  RecordFeatures f;
  f.id                    = std::move(id);
  f.manufacturer.identity = std::move(manufacturer);
  f.unspsc                = std::move(unspsc);
  f.gtin                  = std::move(gtin);
  return f;
}

std::set<std::pair<std::string, std::string>> PairIds(const BlockingResult& result, const std::vector<RecordFeatures>& records) {
  std::set<std::pair<std::string, std::string>> ids;
  for (const auto& bucket : result.buckets) {
    for (const auto& pair : bucket.pairs) ids.emplace(records[pair.a].id, records[pair.b].id);
  }
  return ids;
}

void TestBlockKeys() {
  Blocker blocker;
  assert(blocker.BlockKey(Feature("a", "3M", "31201503")) == "3M|3120");
  assert(blocker.BlockKey(Feature("a", "3M")) == "3M|");
  assert(blocker.BlockKey(Feature("a", "", "31201503")) == "|3120");
  assert(blocker.BlockKey(Feature("a", "")) == kOverflowBucketKey);

  BlockingOptions options;
  options.unspsc_prefix_length = 2;
  assert(Blocker(options).BlockKey(Feature("a", "EATON", "39121011")) == "EATON|39");
}

void TestPairsOnlyWithinBuckets() {
  const std::vector<RecordFeatures> records = {
      Feature("r3", "3M", "31201503"),
      Feature("r1", "3M", "31209999"),
      Feature("r2", "EATON", "39121011"),
  };
  const auto result = Blocker().Block(records);

  assert(result.report.records == 3);
  assert(result.report.buckets == 2);
  assert(result.report.candidate_pairs == 1);
  assert(result.buckets.size() == 1);
  assert(result.buckets[0].key == "3M|3120");
  assert(result.buckets[0].size == 2);

  // pairs are oriented by id, not by input position
  const auto& pair = result.buckets[0].pairs[0];
  assert(records[pair.a].id == "r1");
  assert(records[pair.b].id == "r3");
}

void TestGtinPassBridgesBuckets() {
  const std::vector<RecordFeatures> records = {
      Feature("a", "3M", "31201503", "00012345678905"),
      Feature("b", "SCOTCH", std::nullopt, "00012345678905"),
      Feature("c", "EATON", "39121011"),
  };

  const auto with_gtin = Blocker().Block(records);
  assert(with_gtin.buckets.size() == 1);
  assert(with_gtin.buckets[0].key == "gtin:00012345678905");
  assert((PairIds(with_gtin, records) == std::set<std::pair<std::string, std::string>>{{"a", "b"}}));

  BlockingOptions options;
  options.gtin_pass = false;
  const auto without = Blocker(options).Block(records);
  assert(without.buckets.empty());
  assert(without.report.candidate_pairs == 0);
}

void TestPairSharedByTwoBucketsIsEmittedOnce() {
  const std::vector<RecordFeatures> records = {
      Feature("a", "3M", "31201503", "G1"),
      Feature("b", "3M", "31201503", "G1"),
  };
  const auto result = Blocker().Block(records);

  assert(result.report.buckets == 2);
  assert(result.report.candidate_pairs == 1);
  assert(result.report.duplicate_pairs_dropped == 1);
  assert(result.buckets.size() == 1);
  assert(result.buckets[0].key == "3M|3120");
}

void TestOversizedBucketSkipped() {
  std::vector<RecordFeatures> records;
  for (int i = 0; i < 4; ++i) records.push_back(Feature("r" + std::to_string(i), "3M", "31201503"));
  records.push_back(Feature("x1", "EATON"));
  records.push_back(Feature("x2", "EATON"));

  BlockingOptions options;
  options.max_bucket_size = 3;
  options.overflow_policy = OverflowPolicy::kSkip;
  const auto result       = Blocker(options).Block(records);

  assert(result.buckets.size() == 1);
  assert(result.buckets[0].key == "EATON|");
  assert(result.report.degraded.size() == 1);

  const auto& degraded = result.report.degraded[0];
  assert(degraded.key == "3M|3120");
  assert(degraded.size == 4);
  assert(degraded.policy == OverflowPolicy::kSkip);
  assert(degraded.pairs_kept == 0);
  assert(degraded.pairs_total == 6);
  assert(PolicyName(degraded.policy) == "skip");
}

void TestOverflowBucketUsesItsOwnCap() {
  std::vector<RecordFeatures> records;
  for (int i = 0; i < 4; ++i) records.push_back(Feature("o" + std::to_string(i), ""));

  BlockingOptions options;
  options.overflow_cap    = 3;
  options.overflow_policy = OverflowPolicy::kSkip;
  const auto result       = Blocker(options).Block(records);

  assert(result.report.overflow_records == 4);
  assert(result.buckets.empty());
  assert(result.report.degraded.size() == 1);
  assert(result.report.degraded[0].key == kOverflowBucketKey);

  options.overflow_cap = 10;
  assert(Blocker(options).Block(records).report.candidate_pairs == 6);
}

void TestSampledBucketIsDeterministic() {
  std::vector<RecordFeatures> records;
  for (int i = 0; i < 10; ++i) records.push_back(Feature("id" + std::to_string(i), "3M", "31201503"));

  BlockingOptions options;
  options.max_bucket_size = 5;
  options.overflow_policy = OverflowPolicy::kSample;
  options.sample_pairs    = 7;
  options.sample_seed     = 42;

  const auto first  = Blocker(options).Block(records);
  const auto second = Blocker(options).Block(records);

  assert(first.report.candidate_pairs == 7);
  assert(first.report.degraded.size() == 1);
  assert(first.report.degraded[0].pairs_kept == 7);
  assert(first.report.degraded[0].pairs_total == 45);
  assert(PairIds(first, records) == PairIds(second, records));
  for (const auto& pair : first.buckets[0].pairs) {
    assert(records[pair.a].id < records[pair.b].id);
  }

  // a dense sample goes through the shuffle path
  options.sample_pairs = 40;
  const auto dense     = Blocker(options).Block(records);
  assert(dense.report.candidate_pairs == 40);
  assert(PairIds(dense, records) == PairIds(Blocker(options).Block(records), records));
}

void TestEmptyInput() {
  const auto result = Blocker().Block({});
  assert(result.buckets.empty());
  assert(result.report.records == 0);
  assert(result.report.buckets == 0);
}

} // namespace

int main() {
  TestBlockKeys();
  TestPairsOnlyWithinBuckets();
  TestGtinPassBridgesBuckets();
  TestPairSharedByTwoBucketsIsEmittedOnce();
  TestOversizedBucketSkipped();
  TestOverflowBucketUsesItsOwnCap();
  TestSampledBucketIsDeterministic();
  TestEmptyInput();

  std::cout << "blocker_test: pass\n";
  return 0;
}
