#include "alias_cache.hpp"

#include <mutex>

namespace resolver::alias {

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<CanonicalManufacturer> AliasCache::Get(const std::string& raw) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(raw);
  if (it == cache_.end()) return std::nullopt;

  return it->second;
}

// ------------------------------------------------------------
// PutIfAbsent
// ------------------------------------------------------------

CanonicalManufacturer AliasCache::PutIfAbsent(const std::string& raw, CanonicalManufacturer value) {
  std::unique_lock lock(mutex_);
  auto result = cache_.try_emplace(raw, std::move(value));
  return result.first->second;
}

void AliasCache::Clear() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

std::size_t AliasCache::Size() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace resolver::alias
