#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/features/record_features.hpp"
#include "resolver/v1/types.pb.h"

namespace resolver::clustering {

constexpr double kDefaultClusterThreshold = 0.6;

struct ClusteringOptions {
  double threshold = kDefaultClusterThreshold;
};

struct ClusteringResult {
  std::vector<resolver::v1::GoldenRecord> golden_records;  // ascending golden id
  std::size_t                             edges_above_threshold = 0;
  std::size_t                             unknown_edges         = 0;  // scores naming records not in the input
  std::size_t                             singletons            = 0;
};

// "GR-" + 16 hex digits of FNV-1a 64 over the sorted member ids joined by 0x1F.
std::string GoldenRecordId(std::vector<std::string> member_ids);

/*
  Clusterer

  Every input record is a node; every pair score at or above the threshold is
  an edge; each connected component becomes one golden record. Records with no
  edge become singletons.

  Components are transitive: a-b and b-c above threshold put a, b and c
  together even when a-c scores below it. Callers needing pairwise agreement
  must check the pair scores themselves.

  Representative fields are chosen per field:
    title, description                     longest non-empty, tie -> lowest member id
    manufacturer, part number, unspsc,
    gtin                                   most frequent non-empty value,
                                           tie -> value of the lowest member id
*/
class Clusterer {
 public:
  explicit Clusterer(ClusteringOptions options = {});

  ClusteringResult Cluster(const std::vector<features::RecordFeatures>& records,
                           const std::vector<resolver::v1::PairScore>& scores) const;

  const ClusteringOptions& options() const {
    return options_;
  }

 private:
  ClusteringOptions options_;
};

} // namespace resolver::clustering
