#include "list_flags.hpp"

#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace resolver::cli {

std::uint64_t ParseUint64(const std::string& flag, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw util::InvalidArgument(flag + " expects a non-negative integer, got '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw util::InvalidArgument(flag + " is out of range: " + value);
  }
}

std::uint32_t ParseUint32(const std::string& flag, const std::string& value) {
  const auto parsed = ParseUint64(flag, value);
  if (parsed > std::numeric_limits<std::uint32_t>::max()) {
    throw util::InvalidArgument(flag + " is out of range: " + value);
  }
  return static_cast<std::uint32_t>(parsed);
}

resolver::v1::GoldenRecordSort ParseSort(const std::string& value) {
  if (value == "id") return resolver::v1::GOLDEN_RECORD_SORT_ID;
  if (value == "size") return resolver::v1::GOLDEN_RECORD_SORT_SIZE_DESC;
  if (value == "manufacturer") return resolver::v1::GOLDEN_RECORD_SORT_MANUFACTURER;
  throw util::InvalidArgument("unsupported sort: " + value);
}

resolver::v1::ListGoldenRecordsRequest ParseListRequest(const std::vector<std::string>& args) {
  resolver::v1::ListGoldenRecordsRequest request;
  auto*                                  filter = request.mutable_filter();

  for (std::size_t i = 0; i < args.size(); i += 2) {
    const auto& flag = args[i];
    if (i + 1 >= args.size()) {
      throw util::InvalidArgument(flag + " expects a value");
    }
    const auto& value = args[i + 1];

    if (flag == "--manufacturer") {
      filter->set_manufacturer(value);
    } else if (flag == "--unspsc") {
      filter->set_unspsc_prefix(value);
    } else if (flag == "--min-size") {
      filter->set_min_size(ParseUint32(flag, value));
    } else if (flag == "--max-size") {
      filter->set_max_size(ParseUint32(flag, value));
    } else if (flag == "--text") {
      filter->set_text(value);
    } else if (flag == "--sort") {
      filter->set_sort(ParseSort(value));
    } else if (flag == "--offset") {
      request.set_offset(ParseUint64(flag, value));
    } else if (flag == "--limit") {
      request.set_limit(ParseUint32(flag, value));
    } else {
      throw util::InvalidArgument("unknown list flag: " + flag);
    }
  }
  return request;
}

} // namespace resolver::cli
