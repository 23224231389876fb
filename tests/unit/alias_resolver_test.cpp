#include "internal/alias/alias_resolver.hpp"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace resolver::alias;

constexpr const char* kTableYaml = R"(
manufacturers:
  - canonical: 3M
    aliases: ["3M Company", "Minnesota Mining and Manufacturing", "MMM"]
    subsidiaries: "3M Purification | Ceradyne"
    brands: [Scotch, "Switzerland Brand", Global, "X!"]
  - canonical: Schneider Electric
    aliases: [Square D, "MMM"]
  - canonical: Eaton Corporation
    aliases: "Cutler-Hammer | Eaton Electrical"
)";

AliasTable LoadTable(AliasTableOptions options = {true, true}) {
  return AliasTable::FromYaml(YAML::Load(kTableYaml), options);
}

void TestTableLoadsListsAndPipeStrings() {
  const auto table = LoadTable();

  assert(table.Canonicals().size() == 3);
  assert(table.Canonicals().front() == "3M");
  assert(table.Lookup("3M") == std::optional<std::string>("3M"));
  assert(table.Lookup("MINNESOTA MINING AND MANUFACTURING") == std::optional<std::string>("3M"));
  assert(table.Lookup("CUTLER HAMMER") == std::optional<std::string>("EATON"));
  assert(table.Lookup("EATON ELECTRICAL") == std::optional<std::string>("EATON"));
  assert(table.Lookup("SQUARE D") == std::optional<std::string>("SCHNEIDER ELECTRIC"));
  assert(!table.Lookup("UNKNOWN").has_value());
  assert(!table.Lookup("").has_value());
  assert(table.DisplayName("EATON") == "Eaton Corporation");
}

void TestFirstClaimOnAnAliasWins() {
  const auto table = LoadTable();
  assert(table.Lookup("MMM") == std::optional<std::string>("3M"));
  assert(table.stats().duplicates_dropped == 1);
}

void TestSubsidiariesAndBrandsAreFiltered() {
  const auto table = LoadTable();
  const auto& stats = table.stats();

  assert(table.Lookup("CERADYNE") == std::optional<std::string>("3M"));
  assert(table.Lookup("3M PURIFICATION") == std::optional<std::string>("3M"));
  assert(table.Lookup("SCOTCH") == std::optional<std::string>("3M"));
  assert(!table.Lookup("SWITZERLAND BRAND").has_value());
  assert(!table.Lookup("GLOBAL").has_value());
  assert(stats.subsidiaries_added == 2);
  assert(stats.brands_added == 1);
  assert(stats.brands_filtered == 3);

  const auto plain = LoadTable({});
  assert(!plain.Lookup("CERADYNE").has_value());
  assert(!plain.Lookup("SCOTCH").has_value());
  assert(plain.stats().subsidiaries_added == 0);
}

void TestPlausibleManufacturerNames() {
  assert(IsPlausibleManufacturerName("Ceradyne"));
  assert(!IsPlausibleManufacturerName("AB"));
  assert(!IsPlausibleManufacturerName("***abc***"));
  assert(!IsPlausibleManufacturerName("Acme Canada"));
  assert(!IsPlausibleManufacturerName("Solutions"));
}

void TestEntryWithoutCanonicalIsRejected() {
  bool threw = false;
  try {
    AliasTable::FromYaml(YAML::Load("manufacturers:\n  - aliases: [x]\n"), {});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestCanonicalizeMethods() {
  AliasResolver resolver(LoadTable());

  const auto empty = resolver.Canonicalize("   ");
  assert(empty.empty());
  assert(empty.method == ResolutionMethod::kEmpty);

  const auto table_hit = resolver.Canonicalize("Minnesota Mining & Manufacturing Co.");
  assert(table_hit.identity == "3M");
  assert(table_hit.method == ResolutionMethod::kAliasTable);

  const auto fuzzy = resolver.Canonicalize("Schneider Electrik");
  assert(fuzzy.identity == "SCHNEIDER ELECTRIC");
  assert(fuzzy.method == ResolutionMethod::kFuzzy);
  assert(fuzzy.score >= kDefaultFuzzyThreshold && fuzzy.score < 1.0);

  const auto self = resolver.Canonicalize("Acme Widgets Inc");
  assert(self.identity == "ACME WIDGETS");
  assert(self.method == ResolutionMethod::kSelf);

  assert(MethodName(ResolutionMethod::kFuzzy) == "fuzzy");
}

void TestFuzzyThresholdIsConfigurable() {
  AliasResolver strict(LoadTable(), AliasResolverOptions{1.0});
  const auto    result = strict.Canonicalize("Schneider Electrik");
  assert(result.method == ResolutionMethod::kSelf);
  assert(result.identity == "SCHNEIDER ELECTRIK");
}

void TestAliasesAndIsAliasOf() {
  AliasResolver resolver(LoadTable());

  const auto aliases = resolver.Aliases("Eaton");
  assert(aliases.count("EATON") == 1);
  assert(aliases.count("CUTLER HAMMER") == 1);
  assert(resolver.Aliases("Cutler Hammer") == aliases);
  assert(resolver.Aliases("Nobody").empty());

  assert(resolver.IsAliasOf("3M Company", "MMM"));
  assert(!resolver.IsAliasOf("3M", "Eaton"));
  assert(!resolver.IsAliasOf("", ""));
}

void TestSearchMatchesAnyAlias() {
  AliasResolver resolver(LoadTable());

  const auto hammer = resolver.Search("hammer");
  assert(hammer.size() == 1);
  assert(hammer[0].identity == "EATON");
  assert(hammer[0].display_name == "Eaton Corporation");

  const auto all = resolver.Search("E");
  assert(all.size() == 3);
  assert(resolver.Search("E", 2).size() == 2);
  assert(resolver.Search("", 10).empty());
}

void TestManualAliasOverridesAndDropsCache() {
  AliasResolver resolver(LoadTable());

  assert(resolver.Canonicalize("Cutler Hammer").identity == "EATON");
  assert(resolver.Stats().cached_names == 1);

  resolver.AddManualAlias("Schneider Electric", "Cutler Hammer");
  assert(resolver.Stats().cached_names == 0);
  assert(resolver.Canonicalize("Cutler Hammer").identity == "SCHNEIDER ELECTRIC");
  assert(resolver.Aliases("Eaton").count("CUTLER HAMMER") == 0);

  resolver.AddManualAlias("Panduit Corp", "PAN");
  assert(resolver.Canonicalize("pan").identity == "PANDUIT");
  assert(resolver.Stats().table.canonical_manufacturers == 4);
}

void TestConcurrentCanonicalizeAgrees() {
  AliasResolver            resolver(LoadTable());
  const std::vector<std::string> names = {"3M Company", "Schneider Electrik", "Cutler-Hammer", "Acme", "Scotch"};

  std::atomic<int>         mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        const auto& name = names[static_cast<std::size_t>(i) % names.size()];
        const auto  a    = resolver.Canonicalize(name);
        const auto  b    = resolver.Canonicalize(name);
        if (a.identity != b.identity) ++mismatches;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(mismatches.load() == 0);
  assert(resolver.Stats().cached_names == names.size());
  assert(resolver.Canonicalize("Scotch").identity == "3M");
}

} // namespace

int main() {
  TestTableLoadsListsAndPipeStrings();
  TestFirstClaimOnAnAliasWins();
  TestSubsidiariesAndBrandsAreFiltered();
  TestPlausibleManufacturerNames();
  TestEntryWithoutCanonicalIsRejected();
  TestCanonicalizeMethods();
  TestFuzzyThresholdIsConfigurable();
  TestAliasesAndIsAliasOf();
  TestSearchMatchesAnyAlias();
  TestManualAliasOverridesAndDropsCache();
  TestConcurrentCanonicalizeAgrees();

  std::cout << "alias_resolver_test: pass\n";
  return 0;
}
