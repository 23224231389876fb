#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "generation.hpp"
#include "resolver/v1/query.pb.h"

namespace resolver::query {

constexpr std::uint32_t kDefaultPageSize = 50;
constexpr std::uint32_t kMaxPageSize     = 1000;

// Filter with the manufacturer already canonicalized and the text lower-cased.
struct ResolvedFilter {
  std::string                  manufacturer;
  std::string                  unspsc_prefix;
  std::optional<std::uint32_t> min_size;
  std::optional<std::uint32_t> max_size;
  std::string                  text;
  resolver::v1::GoldenRecordSort sort = resolver::v1::GOLDEN_RECORD_SORT_ID;

  bool Matches(const resolver::v1::GoldenRecord& record) const;
};

/*
  GoldenRecordListing

  A finite, restartable view over one generation. Records are tested against
  the filter as Next() reaches them; nothing is copied until returned.
  Order is by golden record id unless the filter asks for size or
  manufacturer order, in which case ties still fall back to the id.

  Not thread-safe; each caller owns its listing. The generation it reads is
  pinned for the listing's lifetime.
*/
class GoldenRecordListing {
 public:
  GoldenRecordListing(std::shared_ptr<const Generation> generation, ResolvedFilter filter);

  // Next matching record, or nullptr when exhausted.
  const resolver::v1::GoldenRecord* Next();

  // Rewind to the first record.
  void Reset();

  std::size_t CountMatching();

  resolver::v1::ListGoldenRecordsResponse Page(std::uint64_t offset, std::uint32_t limit);

 private:
  std::shared_ptr<const Generation> generation_;
  ResolvedFilter                    filter_;
  std::vector<std::size_t>          order_;  // positions in generation_->golden_records
  std::size_t                       cursor_ = 0;
};

} // namespace resolver::query
