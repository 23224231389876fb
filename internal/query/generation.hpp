#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/blocking/blocker.hpp"
#include "internal/features/record_features.hpp"
#include "internal/similarity/term_statistics.hpp"
#include "resolver/v1/query.pb.h"
#include "resolver/v1/types.pb.h"

namespace resolver::query {

using PairKey = std::pair<std::string, std::string>;  // (smaller id, larger id)

PairKey MakePairKey(const std::string& a, const std::string& b);

/*
  One immutable resolution result.

  Built once by the engine, then only read. Readers hold it through a
  shared_ptr for the duration of one call, so a concurrent rebuild never
  changes what they see.
*/
struct Generation {
  std::uint64_t number = 0;

  std::map<std::string, resolver::v1::Record>   records;   // by id
  std::map<std::string, features::RecordFeatures> features;  // by id

  std::vector<resolver::v1::GoldenRecord>       golden_records;  // ascending id
  std::unordered_map<std::string, std::size_t>  golden_index;    // golden id -> position
  std::unordered_map<std::string, std::string>  record_to_golden;

  std::map<PairKey, resolver::v1::PairScore> pair_scores;

  // IDF of the run; records fetched from the source later are vectorized against it.
  similarity::TermStatistics terms;

  resolver::v1::ResolutionStats stats;
};

struct GenerationInput {
  std::uint64_t                           number = 0;
  std::vector<resolver::v1::Record>       records;
  std::vector<features::RecordFeatures>   features;
  std::vector<resolver::v1::GoldenRecord> golden_records;
  std::vector<resolver::v1::PairScore>    pair_scores;
  similarity::TermStatistics              terms;
  std::size_t                             edges_above_threshold = 0;
  std::vector<blocking::BucketDegradation> degraded;
};

// Indexes the input and fills in ResolutionStats.
std::shared_ptr<const Generation> BuildGeneration(GenerationInput input);

} // namespace resolver::query
