#include "memory_source.hpp"

#include <mutex>

#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace resolver::store::memory {

MemoryRecordSource::MemoryRecordSource(const std::vector<resolver::v1::Record>& records) {
  for (const auto& record : records) {
    Add(record);
  }
}

void MemoryRecordSource::Add(const resolver::v1::Record& record) {
  util::ValidateId(record.id(), "record id");

  std::unique_lock lock(mutex_);
  if (!records_.try_emplace(record.id(), record).second) {
    throw util::InvalidArgument("duplicate record id: " + record.id());
  }
}

void MemoryRecordSource::Upsert(const resolver::v1::Record& record) {
  util::ValidateId(record.id(), "record id");

  std::unique_lock lock(mutex_);
  records_[record.id()] = record;
}

bool MemoryRecordSource::Remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  return records_.erase(id) > 0;
}

size_t MemoryRecordSource::Size() const {
  std::shared_lock lock(mutex_);
  return records_.size();
}

void MemoryRecordSource::IterateAll(const RecordVisitor& visit) {
  // Copy out so visitors may call back into the source.
  std::vector<resolver::v1::Record> snapshot;
  {
    std::shared_lock lock(mutex_);
    snapshot.reserve(records_.size());
    for (const auto& [id, record] : records_) {
      snapshot.push_back(record);
    }
  }

  for (const auto& record : snapshot) {
    visit(record);
  }
}

std::optional<resolver::v1::Record> MemoryRecordSource::Get(const std::string& id) {
  std::shared_lock lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace resolver::store::memory
