#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace resolver::store::memory {

MemoryTransaction::MemoryTransaction(MemoryResolutionSink& sink) : sink_(sink) {
  std::scoped_lock lock(sink_.mutex_);
  working_          = sink_.committed_; // snapshot copy
  snapshot_version_ = sink_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::BackendError("memory transaction already finished");
  }

  std::scoped_lock lock(sink_.mutex_);
  if (sink_.committed_version_ != snapshot_version_) {
    throw util::BackendError("transaction conflict: resolution state was replaced by a concurrent run");
  }
  sink_.committed_ = std::move(working_);
  sink_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  working_     = {};
}

} // namespace resolver::store::memory
