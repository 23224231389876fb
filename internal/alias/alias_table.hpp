#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace YAML {
class Node;
}

namespace resolver::alias {

struct AliasEntry {
  std::string              canonical;
  std::vector<std::string> aliases;
  std::vector<std::string> subsidiaries;
  std::vector<std::string> brands;
};

struct AliasTableOptions {
  bool include_subsidiaries = false;
  bool include_brands       = false;
};

struct AliasTableStats {
  std::size_t canonical_manufacturers = 0;
  std::size_t total_aliases           = 0;
  std::size_t subsidiaries_added      = 0;
  std::size_t subsidiaries_filtered   = 0;
  std::size_t brands_added            = 0;
  std::size_t brands_filtered         = 0;
  std::size_t duplicates_dropped      = 0;
};

/*
  Manufacturer alias table.

  Keys and values are NormalizeManufacturer() forms; a canonical identity
  always resolves to itself. When two entries claim the same alias the first
  one keeps it.

  YAML layout:

    manufacturers:
      - canonical: 3M
        aliases: ["3M Company", "Minnesota Mining and Manufacturing"]
        subsidiaries: "3M Purification | Ceradyne"
        brands: [Scotch, Post-it]

  List fields accept a sequence or a single pipe-delimited string.
*/
class AliasTable {
 public:
  explicit AliasTable(AliasTableOptions options = {});

  static AliasTable LoadYamlFile(const std::string& path, AliasTableOptions options);
  static AliasTable FromYaml(const YAML::Node& root, AliasTableOptions options);

  void AddEntry(const AliasEntry& entry);

  // Manual mapping; replaces any previous owner of the alias.
  void AddManualAlias(std::string_view canonical, std::string_view alias);

  std::optional<std::string> Lookup(const std::string& normalized) const;

  // Sorted canonical identities.
  const std::vector<std::string>& Canonicals() const {
    return canonicals_;
  }

  // Normalized aliases of a canonical identity, the identity included.
  std::set<std::string> AliasesOf(const std::string& identity) const;

  // Canonical name as written in the table, for display.
  std::string DisplayName(const std::string& identity) const;

  const AliasTableStats& stats() const {
    return stats_;
  }

 private:
  bool AddMapping(const std::string& identity, const std::string& alias);
  void RegisterCanonical(const std::string& identity, std::string_view display);

  AliasTableOptions                            options_;
  std::map<std::string, std::set<std::string>> canonical_to_aliases_;
  std::unordered_map<std::string, std::string> alias_to_canonical_;
  std::unordered_map<std::string, std::string> display_names_;
  std::vector<std::string>                     canonicals_;
  AliasTableStats                              stats_;
};

// Conservative filter applied to subsidiary and brand names.
bool IsPlausibleManufacturerName(std::string_view name);

} // namespace resolver::alias
