#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/store/api/record_source.hpp"

namespace resolver::store::memory {

/*
  In-process record source.

  Used by tests and by embedders that already hold their records. Ids are
  validated on insert; Add rejects a duplicate id, Upsert replaces it.
*/
class MemoryRecordSource final : public RecordSource {
 public:
  MemoryRecordSource() = default;
  explicit MemoryRecordSource(const std::vector<resolver::v1::Record>& records);

  void Add(const resolver::v1::Record& record);
  void Upsert(const resolver::v1::Record& record);
  bool Remove(const std::string& id);
  size_t Size() const;

  void IterateAll(const RecordVisitor& visit) override;
  std::optional<resolver::v1::Record> Get(const std::string& id) override;
  std::string Describe() const override {
    return "memory";
  }

 private:
  mutable std::shared_mutex                  mutex_;
  std::map<std::string, resolver::v1::Record> records_;
};

} // namespace resolver::store::memory
