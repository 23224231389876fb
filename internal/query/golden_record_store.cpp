#include "golden_record_store.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace resolver::query {

GoldenRecordStore::GoldenRecordStore() : current_(std::make_shared<const Generation>()) {
}

void GoldenRecordStore::Publish(std::shared_ptr<const Generation> generation) {
  if (!generation) {
    throw util::InvalidArgument("cannot publish an empty generation");
  }

  std::unique_lock lock(mutex_);
  current_ = std::move(generation);
}

std::shared_ptr<const Generation> GoldenRecordStore::Current() const {
  std::shared_lock lock(mutex_);
  return current_;
}

std::uint64_t GoldenRecordStore::CurrentNumber() const {
  std::shared_lock lock(mutex_);
  return current_->number;
}

} // namespace resolver::query
