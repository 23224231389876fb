#pragma once

#include <cstddef>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/alias/alias_cache.hpp"
#include "internal/alias/alias_table.hpp"
#include "internal/alias/canonical_manufacturer.hpp"

namespace resolver::alias {

constexpr double kDefaultFuzzyThreshold = 0.9;

struct AliasResolverOptions {
  double fuzzy_threshold = kDefaultFuzzyThreshold;
};

struct ManufacturerMatch {
  std::string           display_name;
  std::string           identity;
  std::set<std::string> aliases;
};

struct AliasStats {
  AliasTableStats table;
  std::size_t     cached_names = 0;
};

/*
  AliasResolver

  Canonicalize(raw):
    1. NormalizeManufacturer(raw); blank -> kEmpty
    2. alias table hit -> kAliasTable
    3. best Jaro-Winkler against the canonical identities, accepted when
       >= fuzzy_threshold; ties go to the smaller identity -> kFuzzy
    4. otherwise the normalized input itself -> kSelf

  Never throws on lookup. Results are memoized in the owned AliasCache, which
  is safe to hit from concurrent scorers. AddManualAlias() takes the table
  lock exclusively and drops the cache.
*/
class AliasResolver {
 public:
  explicit AliasResolver(AliasTable table = AliasTable{}, AliasResolverOptions options = {});

  AliasResolver(const AliasResolver&)            = delete;
  AliasResolver& operator=(const AliasResolver&) = delete;

  CanonicalManufacturer Canonicalize(std::string_view raw) const;

  std::set<std::string> Aliases(std::string_view canonical) const;

  // Both names resolve to the same non-empty identity.
  bool IsAliasOf(std::string_view a, std::string_view b) const;

  std::vector<ManufacturerMatch> Search(std::string_view query, std::size_t limit = 10) const;

  void AddManualAlias(std::string_view canonical, std::string_view alias);

  AliasStats Stats() const;

  const AliasCache& cache() const {
    return cache_;
  }

 private:
  CanonicalManufacturer Resolve(const std::string& normalized) const;

  AliasResolverOptions      options_;
  mutable std::shared_mutex table_mutex_;
  AliasTable                table_;
  mutable AliasCache        cache_;
};

} // namespace resolver::alias
