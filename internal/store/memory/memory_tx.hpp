#pragma once

#include "internal/store/api/transaction.hpp"
#include "memory_sink.hpp"

namespace resolver::store::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public store::Transaction {
 public:
  explicit MemoryTransaction(MemoryResolutionSink& sink);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryResolutionSink::State& Mutable() {
    return working_;
  }

 private:
  MemoryResolutionSink&       sink_;
  MemoryResolutionSink::State working_;
  uint64_t                    snapshot_version_ = 0;
  bool                        committed_        = false;
  bool                        rolled_back_      = false;
};

} // namespace resolver::store::memory
