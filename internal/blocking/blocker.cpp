#include "blocker.hpp"

#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/hash.hpp"

namespace resolver::blocking {
namespace {

using observability::IntField;
using observability::StringField;

using LocalPair = std::pair<std::size_t, std::size_t>;  // positions inside one bucket

std::size_t PairCount(std::size_t n) {
  return n < 2 ? 0 : n * (n - 1) / 2;
}

std::vector<LocalPair> AllPairs(std::size_t n) {
  std::vector<LocalPair> pairs;
  pairs.reserve(PairCount(n));
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) pairs.emplace_back(i, j);
  }
  return pairs;
}

// Draws `target` distinct pairs out of the n*(n-1)/2 in a bucket. Modulo
// reduction instead of std::uniform_int_distribution keeps the draw identical
// across standard libraries.
std::vector<LocalPair> SamplePairs(std::size_t n, std::size_t target, std::uint64_t seed) {
  const auto total = PairCount(n);
  if (target >= total) return AllPairs(n);

  std::mt19937_64 rng(seed);

  std::vector<LocalPair> sample;
  if (target * 2 >= total) {
    auto pairs = AllPairs(n);
    for (std::size_t i = 0; i < target; ++i) {
      const auto j = i + static_cast<std::size_t>(rng() % (pairs.size() - i));
      std::swap(pairs[i], pairs[j]);
    }
    pairs.resize(target);
    sample = std::move(pairs);
  } else {
    std::set<LocalPair> chosen;
    while (chosen.size() < target) {
      auto i = static_cast<std::size_t>(rng() % n);
      auto j = static_cast<std::size_t>(rng() % n);
      if (i == j) continue;
      if (i > j) std::swap(i, j);
      chosen.emplace(i, j);
    }
    sample.assign(chosen.begin(), chosen.end());
  }

  std::sort(sample.begin(), sample.end());
  return sample;
}

} // namespace

std::string_view PolicyName(OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::kSkip:
      return "skip";
    case OverflowPolicy::kSample:
      return "sample";
  }
  return "unknown";
}

Blocker::Blocker(BlockingOptions options) : options_(options) {
}

std::string Blocker::BlockKey(const features::RecordFeatures& record) const {
  const auto& manufacturer = record.manufacturer.identity;
  std::string prefix;
  if (record.unspsc) {
    prefix = record.unspsc->substr(0, std::min(options_.unspsc_prefix_length, record.unspsc->size()));
  }

  if (manufacturer.empty() && prefix.empty()) {
    return std::string(kOverflowBucketKey);
  }
  return manufacturer + "|" + prefix;
}

std::size_t Blocker::CapFor(std::string_view key) const {
  if (key == kOverflowBucketKey) {
    if (options_.overflow_cap == 0) return options_.max_bucket_size;
    if (options_.max_bucket_size == 0) return options_.overflow_cap;
    return std::min(options_.overflow_cap, options_.max_bucket_size);
  }
  return options_.max_bucket_size;
}

BlockingResult Blocker::Block(const std::vector<features::RecordFeatures>& records) const {
  BlockingResult result;
  result.report.records = records.size();

  std::map<std::string, std::vector<std::size_t>> members;
  std::map<std::string, std::vector<std::size_t>> by_gtin;
  for (std::size_t i = 0; i < records.size(); ++i) {
    members[BlockKey(records[i])].push_back(i);
    if (options_.gtin_pass && records[i].gtin) {
      by_gtin[std::string(kGtinBucketPrefix) + *records[i].gtin].push_back(i);
    }
  }
  for (auto& [key, indices] : by_gtin) {
    if (indices.size() > 1) members.emplace(key, std::move(indices));
  }
  if (auto overflow = members.find(std::string(kOverflowBucketKey)); overflow != members.end()) {
    result.report.overflow_records = overflow->second.size();
  }
  result.report.buckets = members.size();

  const auto n = static_cast<std::uint64_t>(records.size());
  std::unordered_set<std::uint64_t> emitted;

  for (auto& [key, indices] : members) {
    if (indices.size() < 2) continue;

    std::sort(indices.begin(), indices.end(), [&](std::size_t l, std::size_t r) { return records[l].id < records[r].id; });

    const auto             total = PairCount(indices.size());
    const auto             cap   = CapFor(key);
    std::vector<LocalPair> local;
    if (cap != 0 && indices.size() > cap) {
      if (options_.overflow_policy == OverflowPolicy::kSample) {
        local = SamplePairs(indices.size(), options_.sample_pairs, options_.sample_seed ^ util::Fnv1a64(key));
      }

      BucketDegradation degradation{key, indices.size(), options_.overflow_policy, local.size(), total};
      RESOLVER_LOG_WARN("Blocking bucket over cap; coverage degraded",
                        {StringField("bucket", key), IntField("size", static_cast<std::int64_t>(indices.size())),
                         IntField("cap", static_cast<std::int64_t>(cap)), StringField("policy", PolicyName(options_.overflow_policy)),
                         IntField("pairs_kept", static_cast<std::int64_t>(local.size())), IntField("pairs_total", static_cast<std::int64_t>(total))});
      result.report.degraded.push_back(std::move(degradation));
    } else {
      local = AllPairs(indices.size());
    }

    Bucket bucket;
    bucket.key  = key;
    bucket.size = indices.size();
    for (const auto& [i, j] : local) {
      const auto a = indices[i];
      const auto b = indices[j];
      if (!emitted.insert(static_cast<std::uint64_t>(a) * n + b).second) {
        ++result.report.duplicate_pairs_dropped;
        continue;
      }
      bucket.pairs.push_back({a, b});
    }

    result.report.candidate_pairs += bucket.pairs.size();
    if (!bucket.pairs.empty()) result.buckets.push_back(std::move(bucket));
  }

  return result;
}

} // namespace resolver::blocking
