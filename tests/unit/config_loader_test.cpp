#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/engine_options.hpp"
#include "internal/util/errors.hpp"

namespace {

using resolver::config::ConfigLoader;
using resolver::config::EngineOptions;

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "resolver_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / name;
  std::ofstream out(file_path);
  out << content;
  out.close();

  return file_path;
}

template <typename Fn>
bool RejectsWithInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const resolver::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestFullDocumentLoads() {
  const auto yaml_path = WriteFile("full.yaml",
                                   R"(logging:
  level: debug
normalization:
  max_variants: 6
aliases:
  path: aliases.yaml
  fuzzy_threshold: 0.85
  include_brands: true
blocking:
  unspsc_prefix_length: 6
  overflow_cap: 100
  overflow_policy: OVERFLOW_POLICY_SKIP
  sample_seed: 7
  gtin_pass: false
scoring:
  weights:
    part_number: 0.4
    gtin: 0.2
  synergy_bonus: 0.05
clustering:
  threshold: 0.75
workers:
  threads: 3
source:
  csv:
    path: "/data/products.csv"
sink:
  sqlite:
    path: resolution.db
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.normalization().max_variants() == 6);
  assert(config.aliases().fuzzy_threshold() == 0.85);
  assert(config.aliases().include_brands());
  assert(!config.aliases().has_include_subsidiaries());
  assert(config.blocking().overflow_policy() == resolver::runtime::config::OVERFLOW_POLICY_SKIP);
  assert(config.blocking().sample_seed() == 7);
  assert(config.blocking().has_gtin_pass() && !config.blocking().gtin_pass());
  assert(config.scoring().weights().part_number() == 0.4);
  assert(!config.scoring().weights().has_text());
  assert(config.source().backend_case() == resolver::runtime::config::SourceConfig::kCsv);
  assert(config.source().csv().path() == "/data/products.csv");
  assert(config.sink().backend_case() == resolver::runtime::config::SinkConfig::kSqlite);

  const auto options = EngineOptions::FromConfig(config, "/etc/resolver");
  assert(options.max_variants == 6);
  assert(std::filesystem::path(options.alias_path) == std::filesystem::path("/etc/resolver") / "aliases.yaml");
  assert(options.alias_resolver.fuzzy_threshold == 0.85);
  assert(options.alias_table.include_brands);
  assert(!options.alias_table.include_subsidiaries);
  assert(options.blocking.unspsc_prefix_length == 6);
  assert(options.blocking.overflow_cap == 100);
  assert(options.blocking.overflow_policy == resolver::blocking::OverflowPolicy::kSkip);
  assert(!options.blocking.gtin_pass);
  assert(options.scoring.weights.part_number == 0.4);
  assert(options.scoring.weights.gtin == 0.2);
  assert(options.scoring.weights.text == 0.15);
  assert(options.scoring.synergy_bonus == 0.05);
  assert(options.clustering.threshold == 0.75);
  assert(options.threads == 3);
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromString(R"(aliases:
  entries:
    - canonical: "3M"
      aliases: ["0042", "true", 3M Company]
)");

  assert(config.aliases().entries_size() == 1);
  const auto& entry = config.aliases().entries(0);
  assert(entry.canonical() == "3M");
  assert(entry.aliases(0) == "0042");
  assert(entry.aliases(1) == "true");
  assert(entry.aliases(2) == "3M Company");
}

void TestScalarEscapingForBackslashesAndUnicode() {
  const auto config = ConfigLoader::LoadFromString(R"(sink:
  sqlite:
    path: "C:\\resolver\\\"quoted\"\\db.sqlite"
logging:
  pattern: "line1\nline2☃"
)");

  assert(config.sink().sqlite().path() == "C:\\resolver\\\"quoted\"\\db.sqlite");
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString("blocking:\n  bucket_strategy: fancy\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");

  threw = false;
  try {
    (void)ConfigLoader::LoadFromString("- just\n- a list\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/resolver.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentGivesDefaults() {
  const auto config  = ConfigLoader::LoadFromString("");
  const auto options = EngineOptions::FromConfig(config);

  assert(config.source().backend_case() == resolver::runtime::config::SourceConfig::BACKEND_NOT_SET);
  assert(options.max_variants == resolver::normalize::kDefaultMaxVariants);
  assert(options.alias_path.empty());
  assert(options.alias_resolver.fuzzy_threshold == resolver::alias::kDefaultFuzzyThreshold);
  assert(options.blocking.unspsc_prefix_length == 4);
  assert(options.blocking.overflow_cap == 500);
  assert(options.blocking.overflow_policy == resolver::blocking::OverflowPolicy::kSample);
  assert(options.blocking.gtin_pass);
  assert(options.scoring.weights.Sum() <= 1.0 + 1e-9);
  assert(options.scoring.synergy_min_components == 3);
  assert(options.clustering.threshold == resolver::clustering::kDefaultClusterThreshold);
  assert(options.threads == 0);
}

void TestOutOfRangeValuesAreRejected() {
  auto load = [](const std::string& yaml) {
    return EngineOptions::FromConfig(ConfigLoader::LoadFromString(yaml));
  };

  assert(RejectsWithInvalidArgument([&] { load("normalization:\n  max_variants: 0\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("aliases:\n  fuzzy_threshold: 1.5\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("blocking:\n  unspsc_prefix_length: 9\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("blocking:\n  overflow_cap: 0\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("blocking:\n  sample_pairs: 0\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("scoring:\n  weights:\n    text: 0.9\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("scoring:\n  tfidf_weight: -0.5\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("clustering:\n  threshold: -0.1\n"); }));
  assert(RejectsWithInvalidArgument([&] { load("aliases:\n  entries:\n    - aliases: [x]\n"); }));

  // sample_pairs only matters under the sample policy
  const auto skip = load("blocking:\n  overflow_policy: OVERFLOW_POLICY_SKIP\n  sample_pairs: 0\n");
  assert(skip.blocking.overflow_policy == resolver::blocking::OverflowPolicy::kSkip);
}

void TestAliasTableFromFileAndInlineEntries() {
  const auto alias_path = WriteFile("aliases.yaml",
                                    R"(manufacturers:
  - canonical: Eaton
    aliases: "Cutler-Hammer | Eaton Electrical"
)");
  const auto config_path = WriteFile("with_aliases.yaml",
                                     R"(aliases:
  path: aliases.yaml
  entries:
    - canonical: Panduit
      aliases: [Panduit Corp]
)");

  const auto config  = ConfigLoader::LoadFromYaml(config_path.string());
  const auto options = EngineOptions::FromConfig(config, config_path.parent_path().string());
  assert(std::filesystem::path(options.alias_path) == alias_path);

  const auto table = options.BuildAliasTable();
  assert(table.Canonicals().size() == 2);
  assert(table.Lookup("CUTLER HAMMER") == std::optional<std::string>("EATON"));
  assert(table.Lookup("PANDUIT") == std::optional<std::string>("PANDUIT"));

  auto missing       = options;
  missing.alias_path = "/nonexistent/aliases.yaml";
  bool threw         = false;
  try {
    (void)missing.BuildAliasTable();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullDocumentLoads();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForBackslashesAndUnicode();
  TestUnknownFieldsAreRejected();
  TestEmptyDocumentGivesDefaults();
  TestOutOfRangeValuesAreRejected();
  TestAliasTableFromFileAndInlineEntries();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
