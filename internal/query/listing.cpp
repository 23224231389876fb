#include "listing.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <string_view>

namespace resolver::query {

namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool ContainsLower(std::string_view haystack, const std::string& lowered_needle) {
  return Lower(haystack).find(lowered_needle) != std::string::npos;
}

} // namespace

bool ResolvedFilter::Matches(const resolver::v1::GoldenRecord& record) const {
  const auto& rep = record.representative();

  if (!manufacturer.empty() && rep.manufacturer() != manufacturer) {
    return false;
  }
  if (!unspsc_prefix.empty() && rep.unspsc().compare(0, unspsc_prefix.size(), unspsc_prefix) != 0) {
    return false;
  }

  const auto size = static_cast<std::uint32_t>(record.member_ids_size());
  if (min_size && size < *min_size) return false;
  if (max_size && size > *max_size) return false;

  if (!text.empty()) {
    return ContainsLower(rep.title(), text) || ContainsLower(rep.description(), text) || ContainsLower(rep.part_number(), text);
  }
  return true;
}

GoldenRecordListing::GoldenRecordListing(std::shared_ptr<const Generation> generation, ResolvedFilter filter)
    : generation_(std::move(generation)), filter_(std::move(filter)) {
  const auto& records = generation_->golden_records;
  order_.resize(records.size());
  std::iota(order_.begin(), order_.end(), 0);

  // golden_records is id-ordered, so a stable sort keeps id as the tie-break.
  switch (filter_.sort) {
    case resolver::v1::GOLDEN_RECORD_SORT_SIZE_DESC:
      std::stable_sort(order_.begin(), order_.end(), [&](std::size_t a, std::size_t b) {
        return records[a].member_ids_size() > records[b].member_ids_size();
      });
      break;
    case resolver::v1::GOLDEN_RECORD_SORT_MANUFACTURER:
      std::stable_sort(order_.begin(), order_.end(), [&](std::size_t a, std::size_t b) {
        return records[a].representative().manufacturer() < records[b].representative().manufacturer();
      });
      break;
    default:
      break;
  }
}

const resolver::v1::GoldenRecord* GoldenRecordListing::Next() {
  const auto& records = generation_->golden_records;
  while (cursor_ < order_.size()) {
    const auto& record = records[order_[cursor_++]];
    if (filter_.Matches(record)) {
      return &record;
    }
  }
  return nullptr;
}

void GoldenRecordListing::Reset() {
  cursor_ = 0;
}

std::size_t GoldenRecordListing::CountMatching() {
  Reset();
  std::size_t count = 0;
  while (Next()) ++count;
  Reset();
  return count;
}

resolver::v1::ListGoldenRecordsResponse GoldenRecordListing::Page(std::uint64_t offset, std::uint32_t limit) {
  if (limit == 0) limit = kDefaultPageSize;
  limit = std::min(limit, kMaxPageSize);

  resolver::v1::ListGoldenRecordsResponse response;
  std::uint64_t                           matched = 0;

  Reset();
  while (const auto* record = Next()) {
    if (matched >= offset && static_cast<std::uint64_t>(response.golden_records_size()) < limit) {
      *response.add_golden_records() = *record;
    }
    ++matched;
  }
  Reset();

  response.set_total_matched(matched);
  const std::uint64_t end = offset + static_cast<std::uint64_t>(response.golden_records_size());
  response.set_next_offset(end < matched ? end : 0);
  return response;
}

} // namespace resolver::query
