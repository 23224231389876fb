#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "resolver/v1/query.pb.h"

namespace resolver::cli {

/*
  Flag parsing for `resolverctl list`.

  Every parser throws util::InvalidArgument on a malformed or
  out-of-range value, which main maps to its invalid-argument exit code.
*/

std::uint64_t ParseUint64(const std::string& flag, const std::string& value);

// Rejects values above the uint32 range instead of truncating them.
std::uint32_t ParseUint32(const std::string& flag, const std::string& value);

resolver::v1::GoldenRecordSort ParseSort(const std::string& value);

resolver::v1::ListGoldenRecordsRequest ParseListRequest(const std::vector<std::string>& args);

} // namespace resolver::cli
