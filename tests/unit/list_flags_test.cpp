#include "cmd/resolverctl/list_flags.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using resolver::cli::ParseListRequest;
using resolver::cli::ParseUint32;

bool Rejects(const std::vector<std::string>& args) {
  try {
    ParseListRequest(args);
  } catch (const resolver::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestFlagsFillTheRequest() {
  const auto request = ParseListRequest({"--manufacturer", "3M", "--unspsc", "3120", "--min-size", "2", "--max-size", "5", "--text",
                                         "tape", "--sort", "size", "--offset", "10", "--limit", "25"});
  assert(request.filter().manufacturer() == "3M");
  assert(request.filter().unspsc_prefix() == "3120");
  assert(request.filter().min_size() == 2);
  assert(request.filter().max_size() == 5);
  assert(request.filter().text() == "tape");
  assert(request.filter().sort() == resolver::v1::GOLDEN_RECORD_SORT_SIZE_DESC);
  assert(request.offset() == 10);
  assert(request.limit() == 25);

  const auto empty = ParseListRequest({});
  assert(!empty.filter().has_min_size());
  assert(empty.limit() == 0);
}

void TestValuesBeyondUint32AreRejected() {
  assert(ParseUint32("--limit", "4294967295") == 4294967295u);
  assert(ParseListRequest({"--max-size", "4294967295"}).filter().max_size() == 4294967295u);

  // 2^32 + 1 would wrap to a limit of 1
  assert(Rejects({"--limit", "4294967297"}));
  assert(Rejects({"--min-size", "4294967296"}));
  assert(Rejects({"--max-size", "99999999999"}));

  // offset is 64-bit wide
  assert(ParseListRequest({"--offset", "4294967296"}).offset() == 4294967296ull);
  assert(Rejects({"--offset", "18446744073709551616"}));
}

void TestMalformedFlagsAreRejected() {
  assert(Rejects({"--limit", "-1"}));
  assert(Rejects({"--limit", "1e3"}));
  assert(Rejects({"--limit", ""}));
  assert(Rejects({"--limit"}));
  assert(Rejects({"--sort", "price"}));
  assert(Rejects({"--colour", "red"}));
}

} // namespace

int main() {
  TestFlagsFillTheRequest();
  TestValuesBeyondUint32AreRejected();
  TestMalformedFlagsAreRejected();

  std::cout << "list_flags_test: pass\n";
  return 0;
}
