#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/features/record_features.hpp"

namespace resolver::blocking {

constexpr std::string_view kOverflowBucketKey = "*overflow*";
constexpr std::string_view kGtinBucketPrefix  = "gtin:";

enum class OverflowPolicy {
  kSkip,    // oversized bucket emits no pairs
  kSample,  // oversized bucket emits a deterministic sample
};

std::string_view PolicyName(OverflowPolicy policy);

struct BlockingOptions {
  std::size_t    unspsc_prefix_length = 4;
  std::size_t    overflow_cap         = 500;
  std::size_t    max_bucket_size      = 0;  // 0 = unbounded
  OverflowPolicy overflow_policy      = OverflowPolicy::kSample;
  std::size_t    sample_pairs         = 10000;
  std::uint64_t  sample_seed          = 0;
  bool           gtin_pass            = true;
};

// Indices into the feature vector handed to Block(); features[a].id < features[b].id.
struct CandidatePair {
  std::size_t a = 0;
  std::size_t b = 0;
};

struct Bucket {
  std::string                key;
  std::size_t                size = 0;
  std::vector<CandidatePair> pairs;
};

struct BucketDegradation {
  std::string    key;
  std::size_t    size        = 0;
  OverflowPolicy policy      = OverflowPolicy::kSkip;
  std::size_t    pairs_kept  = 0;
  std::size_t    pairs_total = 0;
};

struct BlockingReport {
  std::size_t                    records                 = 0;
  std::size_t                    buckets                 = 0;
  std::size_t                    overflow_records        = 0;
  std::size_t                    candidate_pairs         = 0;
  std::size_t                    duplicate_pairs_dropped = 0;
  std::vector<BucketDegradation> degraded;
};

struct BlockingResult {
  std::vector<Bucket> buckets;  // key order, only buckets that produced pairs
  BlockingReport      report;
};

/*
  Blocker

  Key: "<canonical manufacturer>|<unspsc prefix>", "<manufacturer>|" without a
  UNSPSC, "|<prefix>" without a manufacturer, kOverflowBucketKey with neither.
  The GTIN pass adds one "gtin:<value>" bucket per shared GTIN.

  Buckets are visited in key order; a pair already produced by an earlier
  bucket is dropped, so every candidate pair appears exactly once. A bucket
  larger than its cap (overflow_cap for the overflow bucket, max_bucket_size
  for the rest) is degraded by policy, logged, and listed in the report.

  Record ids must be unique; the engine rejects duplicates before blocking.
*/
class Blocker {
 public:
  explicit Blocker(BlockingOptions options = {});

  std::string BlockKey(const features::RecordFeatures& record) const;

  BlockingResult Block(const std::vector<features::RecordFeatures>& records) const;

  const BlockingOptions& options() const {
    return options_;
  }

 private:
  std::size_t CapFor(std::string_view key) const;

  BlockingOptions options_;
};

} // namespace resolver::blocking
