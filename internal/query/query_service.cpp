#include "query_service.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace resolver::query {

namespace {

resolver::v1::ProductSummary Summarize(const resolver::v1::Record& record) {
  resolver::v1::ProductSummary summary;
  summary.set_id(record.id());
  summary.set_source_key(record.source_key());
  summary.set_manufacturer(record.manufacturer_raw());
  summary.set_part_number(record.part_number_raw());
  summary.set_title(record.title());
  summary.set_description(record.description());
  return summary;
}

} // namespace

QueryService::QueryService(std::shared_ptr<const GoldenRecordStore>    store,
                           std::shared_ptr<store::RecordSource>        source,
                           std::shared_ptr<const alias::AliasResolver> aliases,
                           scoring::PairScorer                         scorer,
                           normalize::VariantGenerator                 variants)
    : store_(std::move(store)),
      source_(std::move(source)),
      aliases_(std::move(aliases)),
      scorer_(std::move(scorer)),
      variants_(std::move(variants)) {
  if (!store_ || !source_ || !aliases_) {
    throw util::InvalidArgument("query service requires a golden record store, a record source and an alias resolver");
  }
}

QueryService::LoadedRecord QueryService::Load(const Generation& generation, const std::string& id) const {
  auto record = generation.records.find(id);
  auto cached = generation.features.find(id);
  if (record != generation.records.end() && cached != generation.features.end()) {
    return {record->second, cached->second};
  }

  auto fetched = source_->Get(id);
  if (!fetched) {
    throw util::NotFound("record not found: " + id);
  }

  features::FeatureExtractor extractor(variants_, *aliases_);
  auto                       extracted = extractor.Extract(*fetched, generation.terms);
  return {std::move(*fetched), std::move(extracted)};
}

// ------------------------------------------------------------------
// Point lookups
// ------------------------------------------------------------------

resolver::v1::Record QueryService::GetRecord(const std::string& id) const {
  util::ValidateId(id, "record id");

  auto generation = store_->Current();
  auto it         = generation->records.find(id);
  if (it != generation->records.end()) {
    return it->second;
  }

  auto fetched = source_->Get(id);
  if (!fetched) {
    throw util::NotFound("record not found: " + id);
  }
  return std::move(*fetched);
}

resolver::v1::GoldenRecord QueryService::GetGoldenRecord(const std::string& id) const {
  util::ValidateId(id, "golden record id");

  auto generation = store_->Current();
  auto it         = generation->golden_index.find(id);
  if (it == generation->golden_index.end()) {
    throw util::NotFound("golden record not found: " + id);
  }
  return generation->golden_records[it->second];
}

resolver::v1::GoldenRecord QueryService::GetGoldenRecordForRecord(const std::string& record_id) const {
  util::ValidateId(record_id, "record id");

  auto generation = store_->Current();
  auto it         = generation->record_to_golden.find(record_id);
  if (it == generation->record_to_golden.end()) {
    throw util::NotFound("no golden record contains record " + record_id);
  }
  return generation->golden_records[generation->golden_index.at(it->second)];
}

// ------------------------------------------------------------------
// Listing
// ------------------------------------------------------------------

ResolvedFilter QueryService::Resolve(const resolver::v1::GoldenRecordFilter& filter) const {
  ResolvedFilter resolved;

  if (!filter.manufacturer().empty()) {
    auto canonical = aliases_->Canonicalize(filter.manufacturer());
    if (canonical.empty()) {
      throw util::InvalidArgument("manufacturer filter has no usable characters");
    }
    resolved.manufacturer = canonical.identity;
  }

  const auto& prefix = filter.unspsc_prefix();
  if (!prefix.empty()) {
    const bool digits = std::all_of(prefix.begin(), prefix.end(), [](unsigned char c) {
      return std::isdigit(c) != 0;
    });
    if (!digits || prefix.size() < 2 || prefix.size() > 8) {
      throw util::InvalidArgument("unspsc prefix must be 2 to 8 digits: " + prefix);
    }
    resolved.unspsc_prefix = prefix;
  }

  if (filter.has_min_size()) resolved.min_size = filter.min_size();
  if (filter.has_max_size()) resolved.max_size = filter.max_size();
  if (resolved.min_size && resolved.max_size && *resolved.min_size > *resolved.max_size) {
    throw util::InvalidArgument("min_size is greater than max_size");
  }

  resolved.text = filter.text();
  std::transform(resolved.text.begin(), resolved.text.end(), resolved.text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  switch (filter.sort()) {
    case resolver::v1::GOLDEN_RECORD_SORT_ID:
    case resolver::v1::GOLDEN_RECORD_SORT_SIZE_DESC:
    case resolver::v1::GOLDEN_RECORD_SORT_MANUFACTURER:
      resolved.sort = filter.sort();
      break;
    default:
      throw util::InvalidArgument("unknown golden record sort order");
  }
  return resolved;
}

GoldenRecordListing QueryService::ListGoldenRecords(const resolver::v1::GoldenRecordFilter& filter) const {
  auto resolved = Resolve(filter);
  return GoldenRecordListing(store_->Current(), std::move(resolved));
}

resolver::v1::ListGoldenRecordsResponse QueryService::ListGoldenRecords(const resolver::v1::ListGoldenRecordsRequest& request) const {
  if (request.limit() > kMaxPageSize) {
    throw util::InvalidArgument("limit exceeds " + std::to_string(kMaxPageSize));
  }
  auto listing = ListGoldenRecords(request.filter());
  return listing.Page(request.offset(), request.limit());
}

// ------------------------------------------------------------------
// Compare / stats
// ------------------------------------------------------------------

resolver::v1::ComparisonResult QueryService::Compare(const std::string& id_a, const std::string& id_b) const {
  util::ValidateId(id_a, "record id");
  util::ValidateId(id_b, "record id");

  auto       generation = store_->Current();
  const auto first      = Load(*generation, id_a);
  const auto second     = Load(*generation, id_b);

  resolver::v1::ComparisonResult result;
  *result.mutable_product_a() = Summarize(first.record);
  *result.mutable_product_b() = Summarize(second.record);

  resolver::v1::PairScore score;
  auto                    cached = generation->pair_scores.find(MakePairKey(id_a, id_b));
  if (cached != generation->pair_scores.end()) {
    score = cached->second;
    result.set_cached(true);
  } else {
    score = scorer_.Score(first.features, second.features);
  }

  // Stored scores are ordered by id; flip when the caller asked the other way round.
  if (score.id_a() == id_a) {
    *result.mutable_comparison() = score.comparison();
  } else {
    *result.mutable_comparison() = scoring::SwapSides(score.comparison());
  }
  result.set_overall_score(score.overall_score());

  auto golden_a = generation->record_to_golden.find(id_a);
  auto golden_b = generation->record_to_golden.find(id_b);
  result.set_same_golden_record(golden_a != generation->record_to_golden.end() &&
                                golden_b != generation->record_to_golden.end() &&
                                golden_a->second == golden_b->second);
  return result;
}

resolver::v1::ResolutionStats QueryService::Stats() const {
  return store_->Current()->stats;
}

} // namespace resolver::query
