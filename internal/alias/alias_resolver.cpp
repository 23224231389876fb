#include "alias_resolver.hpp"

#include <mutex>

#include "internal/normalize/normalizer.hpp"
#include "internal/similarity/string_metrics.hpp"

namespace resolver::alias {

AliasResolver::AliasResolver(AliasTable table, AliasResolverOptions options) : options_(options), table_(std::move(table)) {
}

CanonicalManufacturer AliasResolver::Resolve(const std::string& normalized) const {
  if (normalized.empty()) {
    return {};
  }

  if (auto identity = table_.Lookup(normalized)) {
    return {*identity, ResolutionMethod::kAliasTable, 1.0};
  }

  const std::string* best       = nullptr;
  double             best_score = 0.0;
  // Canonicals() is sorted, so a strict improvement keeps the smaller identity on ties
  for (const auto& identity : table_.Canonicals()) {
    const double score = similarity::JaroWinkler(normalized, identity);
    if (score > best_score) {
      best       = &identity;
      best_score = score;
    }
  }
  if (best && best_score >= options_.fuzzy_threshold) {
    return {*best, ResolutionMethod::kFuzzy, best_score};
  }

  return {normalized, ResolutionMethod::kSelf, 1.0};
}

CanonicalManufacturer AliasResolver::Canonicalize(std::string_view raw) const {
  const std::string key(raw);

  std::shared_lock lock(table_mutex_);
  if (auto cached = cache_.Get(key)) {
    return *cached;
  }
  return cache_.PutIfAbsent(key, Resolve(normalize::NormalizeManufacturer(raw)));
}

std::set<std::string> AliasResolver::Aliases(std::string_view canonical) const {
  const auto       normalized = normalize::NormalizeManufacturer(canonical);
  std::shared_lock lock(table_mutex_);
  auto             identity = table_.Lookup(normalized);
  if (!identity) return {};
  return table_.AliasesOf(*identity);
}

bool AliasResolver::IsAliasOf(std::string_view a, std::string_view b) const {
  const auto left  = Canonicalize(a);
  const auto right = Canonicalize(b);
  return !left.empty() && left.identity == right.identity;
}

std::vector<ManufacturerMatch> AliasResolver::Search(std::string_view query, std::size_t limit) const {
  const auto needle = normalize::NormalizeManufacturer(query);

  std::vector<ManufacturerMatch> matches;
  if (needle.empty() || limit == 0) return matches;

  std::shared_lock lock(table_mutex_);
  for (const auto& identity : table_.Canonicals()) {
    auto aliases = table_.AliasesOf(identity);
    bool hit     = false;
    for (const auto& alias : aliases) {
      if (alias.find(needle) != std::string::npos) {
        hit = true;
        break;
      }
    }
    if (!hit) continue;

    matches.push_back({table_.DisplayName(identity), identity, std::move(aliases)});
    if (matches.size() >= limit) break;
  }
  return matches;
}

void AliasResolver::AddManualAlias(std::string_view canonical, std::string_view alias) {
  std::unique_lock lock(table_mutex_);
  table_.AddManualAlias(canonical, alias);
  cache_.Clear();
}

AliasStats AliasResolver::Stats() const {
  std::shared_lock lock(table_mutex_);
  return {table_.stats(), cache_.Size()};
}

} // namespace resolver::alias
