#pragma once

#include <memory>
#include <string>

#include "golden_record_store.hpp"
#include "internal/alias/alias_resolver.hpp"
#include "internal/features/record_features.hpp"
#include "internal/normalize/variant_generator.hpp"
#include "internal/scoring/pair_scorer.hpp"
#include "internal/store/api/record_source.hpp"
#include "listing.hpp"
#include "resolver/v1/query.pb.h"

namespace resolver::query {

/*
  Read API over the published generation.

  Every call takes the current generation once. Record lookups and Compare
  fall back to the record source for ids the generation does not hold
  (records ingested after the last run, or before the first one); such
  records are featurized against the generation's IDF and scored on demand.
  Malformed ids and filters throw util::InvalidArgument before any lookup;
  ids unknown to both throw util::NotFound.
*/
class QueryService {
 public:
  QueryService(std::shared_ptr<const GoldenRecordStore>    store,
               std::shared_ptr<store::RecordSource>        source,
               std::shared_ptr<const alias::AliasResolver> aliases,
               scoring::PairScorer                         scorer,
               normalize::VariantGenerator                 variants = normalize::VariantGenerator());

  resolver::v1::Record GetRecord(const std::string& id) const;

  resolver::v1::GoldenRecord GetGoldenRecord(const std::string& id) const;

  resolver::v1::GoldenRecord GetGoldenRecordForRecord(const std::string& record_id) const;

  GoldenRecordListing ListGoldenRecords(const resolver::v1::GoldenRecordFilter& filter) const;

  resolver::v1::ListGoldenRecordsResponse ListGoldenRecords(const resolver::v1::ListGoldenRecordsRequest& request) const;

  // Oriented to the argument order; cached when the pair was scored during the run.
  resolver::v1::ComparisonResult Compare(const std::string& id_a, const std::string& id_b) const;

  resolver::v1::ResolutionStats Stats() const;

 private:
  struct LoadedRecord {
    resolver::v1::Record     record;
    features::RecordFeatures features;
  };

  ResolvedFilter Resolve(const resolver::v1::GoldenRecordFilter& filter) const;

  LoadedRecord Load(const Generation& generation, const std::string& id) const;

  std::shared_ptr<const GoldenRecordStore>    store_;
  std::shared_ptr<store::RecordSource>        source_;
  std::shared_ptr<const alias::AliasResolver> aliases_;
  scoring::PairScorer                         scorer_;
  normalize::VariantGenerator                 variants_;
};

} // namespace resolver::query
