#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/alias/canonical_manufacturer.hpp"

namespace resolver::alias {

/*
  Per-resolver memo of raw manufacturer string -> canonical identity.

  Read-mostly. Concurrent inserts of the same key are idempotent: the first
  stored value wins and is returned to every caller.
*/
class AliasCache {
 public:
  std::optional<CanonicalManufacturer> Get(const std::string& raw) const;

  CanonicalManufacturer PutIfAbsent(const std::string& raw, CanonicalManufacturer value);

  void Clear();

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                              mutex_;
  std::unordered_map<std::string, CanonicalManufacturer> cache_;
};

} // namespace resolver::alias
