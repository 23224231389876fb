#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>

#include "internal/store/api/resolution_sink.hpp"

namespace resolver::store::memory {

class MemoryTransaction;

class MemoryResolutionSink final : public ResolutionSink {
 public:
  MemoryResolutionSink() = default;

  std::unique_ptr<Transaction> Begin() override;

  Result WriteGoldenRecords(Transaction&, const std::vector<resolver::v1::GoldenRecord>&) override;
  Result WritePairScores(Transaction&, const std::vector<resolver::v1::PairScore>&) override;

  std::vector<resolver::v1::GoldenRecord> ReadGoldenRecords() override;
  std::vector<resolver::v1::PairScore> ReadPairScores() override;

  std::string Describe() const override {
    return "memory";
  }

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, resolver::v1::GoldenRecord>                    golden_records;
    std::map<std::pair<std::string, std::string>, resolver::v1::PairScore> pair_scores;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace resolver::store::memory
