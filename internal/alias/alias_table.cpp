#include "alias_table.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

#include "internal/normalize/normalizer.hpp"
#include "internal/observability/logging.hpp"

namespace resolver::alias {
namespace {

using observability::IntField;
using observability::StringField;

constexpr std::array<std::string_view, 23> kLocationWords = {
    "switzerland", "germany", "united kingdom", "canada",  "france",  "italy",   "japan",   "netherlands",
    "sweden",      "norway",  "denmark",        "australia", "brazil", "mexico",  "spain",   "portugal",
    "poland",      "czech",   "hungary",        "austria", "belgium", "finland", "ireland"};

constexpr std::array<std::string_view, 17> kGenericBusinessWords = {
    "corporation", "inc",           "llc",    "ltd",     "co",           "company",   "group",
    "holdings",    "enterprises",   "international", "global", "systems", "technologies", "solutions",
    "services",    "products",      "industries"};

std::string Trim(std::string_view s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) return {};
  auto end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(begin, end - begin + 1));
}

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string> SplitPipes(const std::string& text) {
  std::vector<std::string> names;
  std::size_t              start = 0;
  while (start <= text.size()) {
    auto end = text.find('|', start);
    if (end == std::string::npos) end = text.size();
    auto name = Trim(std::string_view(text).substr(start, end - start));
    if (!name.empty()) names.push_back(std::move(name));
    start = end + 1;
  }
  return names;
}

std::vector<std::string> ReadNames(const YAML::Node& node) {
  std::vector<std::string> names;
  if (!node || node.IsNull()) return names;
  if (node.IsScalar()) return SplitPipes(node.Scalar());
  if (!node.IsSequence()) throw std::runtime_error("alias table: expected a list or a pipe-delimited string");
  for (const auto& item : node) {
    auto name = Trim(item.as<std::string>());
    if (!name.empty()) names.push_back(std::move(name));
  }
  return names;
}

} // namespace

bool IsPlausibleManufacturerName(std::string_view raw) {
  const auto name = Trim(raw);
  if (name.size() < 3) return false;

  const auto kept = std::count_if(name.begin(), name.end(), [](unsigned char c) { return std::isalnum(c) || std::isspace(c); });
  if (static_cast<double>(kept) < static_cast<double>(name.size()) * 0.5) return false;

  const auto lower = Lower(name);
  for (auto location : kLocationWords) {
    if (lower.find(location) != std::string::npos) return false;
  }

  return std::find(kGenericBusinessWords.begin(), kGenericBusinessWords.end(), lower) == kGenericBusinessWords.end();
}

AliasTable::AliasTable(AliasTableOptions options) : options_(options) {
}

AliasTable AliasTable::LoadYamlFile(const std::string& path, AliasTableOptions options) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load alias table " + path + ": " + e.what());
  }

  auto table = FromYaml(root, options);
  RESOLVER_LOG_INFO("Loaded manufacturer alias table", {StringField("path", path),
                                                        IntField("canonical_manufacturers", static_cast<std::int64_t>(table.stats().canonical_manufacturers)),
                                                        IntField("aliases", static_cast<std::int64_t>(table.stats().total_aliases)),
                                                        IntField("duplicates_dropped", static_cast<std::int64_t>(table.stats().duplicates_dropped))});
  return table;
}

AliasTable AliasTable::FromYaml(const YAML::Node& root, AliasTableOptions options) {
  AliasTable table(options);
  if (!root || root.IsNull()) return table;

  const YAML::Node entries = root.IsMap() ? root["manufacturers"] : root;
  if (!entries || entries.IsNull()) return table;
  if (!entries.IsSequence()) throw std::runtime_error("alias table: 'manufacturers' must be a list");

  std::size_t index = 0;
  for (const auto& node : entries) {
    if (!node.IsMap() || !node["canonical"]) {
      throw std::runtime_error("alias table: entry " + std::to_string(index) + " has no canonical name");
    }
    AliasEntry entry;
    entry.canonical    = Trim(node["canonical"].as<std::string>());
    entry.aliases      = ReadNames(node["aliases"]);
    entry.subsidiaries = ReadNames(node["subsidiaries"]);
    entry.brands       = ReadNames(node["brands"]);
    table.AddEntry(entry);
    ++index;
  }
  return table;
}

void AliasTable::RegisterCanonical(const std::string& identity, std::string_view display) {
  if (!canonical_to_aliases_.try_emplace(identity).second) return;

  display_names_.emplace(identity, Trim(display));
  canonicals_.insert(std::lower_bound(canonicals_.begin(), canonicals_.end(), identity), identity);
  stats_.canonical_manufacturers = canonical_to_aliases_.size();
}

bool AliasTable::AddMapping(const std::string& identity, const std::string& alias) {
  if (alias.empty() || alias == identity) return false;
  if (canonical_to_aliases_.count(alias) || alias_to_canonical_.count(alias)) {
    ++stats_.duplicates_dropped;
    return false;
  }
  alias_to_canonical_.emplace(alias, identity);
  canonical_to_aliases_[identity].insert(alias);
  stats_.total_aliases = alias_to_canonical_.size();
  return true;
}

void AliasTable::AddEntry(const AliasEntry& entry) {
  const auto identity = normalize::NormalizeManufacturer(entry.canonical);
  if (identity.empty()) return;

  // an identity first seen as somebody's alias becomes canonical in its own right
  if (auto it = alias_to_canonical_.find(identity); it != alias_to_canonical_.end()) {
    canonical_to_aliases_[it->second].erase(identity);
    alias_to_canonical_.erase(it);
    stats_.total_aliases = alias_to_canonical_.size();
  }
  RegisterCanonical(identity, entry.canonical);

  for (const auto& alias : entry.aliases) {
    AddMapping(identity, normalize::NormalizeManufacturer(alias));
  }

  if (options_.include_subsidiaries) {
    for (const auto& name : entry.subsidiaries) {
      if (!IsPlausibleManufacturerName(name)) {
        ++stats_.subsidiaries_filtered;
        continue;
      }
      if (AddMapping(identity, normalize::NormalizeManufacturer(name))) ++stats_.subsidiaries_added;
    }
  }

  if (options_.include_brands) {
    for (const auto& name : entry.brands) {
      if (!IsPlausibleManufacturerName(name)) {
        ++stats_.brands_filtered;
        continue;
      }
      if (AddMapping(identity, normalize::NormalizeManufacturer(name))) ++stats_.brands_added;
    }
  }
}

void AliasTable::AddManualAlias(std::string_view canonical, std::string_view alias) {
  const auto identity   = normalize::NormalizeManufacturer(canonical);
  const auto normalized = normalize::NormalizeManufacturer(alias);
  if (identity.empty() || normalized.empty()) return;

  RegisterCanonical(identity, canonical);
  if (normalized == identity) return;

  if (auto it = alias_to_canonical_.find(normalized); it != alias_to_canonical_.end()) {
    canonical_to_aliases_[it->second].erase(normalized);
    alias_to_canonical_.erase(it);
  }
  alias_to_canonical_.emplace(normalized, identity);
  canonical_to_aliases_[identity].insert(normalized);
  stats_.total_aliases = alias_to_canonical_.size();
}

std::optional<std::string> AliasTable::Lookup(const std::string& normalized) const {
  if (normalized.empty()) return std::nullopt;
  if (canonical_to_aliases_.count(normalized)) return normalized;
  if (auto it = alias_to_canonical_.find(normalized); it != alias_to_canonical_.end()) return it->second;
  return std::nullopt;
}

std::set<std::string> AliasTable::AliasesOf(const std::string& identity) const {
  auto it = canonical_to_aliases_.find(identity);
  if (it == canonical_to_aliases_.end()) return {};

  auto aliases = it->second;
  aliases.insert(identity);
  return aliases;
}

std::string AliasTable::DisplayName(const std::string& identity) const {
  if (auto it = display_names_.find(identity); it != display_names_.end()) return it->second;
  return identity;
}

} // namespace resolver::alias
