#include "memory_sink.hpp"

#include "memory_tx.hpp"

namespace resolver::store::memory {

namespace {

MemoryTransaction& TX(Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

} // namespace

std::unique_ptr<Transaction> MemoryResolutionSink::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryResolutionSink::WriteGoldenRecords(Transaction& t, const std::vector<resolver::v1::GoldenRecord>& records) {
  auto& state = TX(t).Mutable();
  state.golden_records.clear();

  for (const auto& record : records) {
    if (!state.golden_records.try_emplace(record.id(), record).second) {
      return Result::Err(ErrorCode::ConstraintViolation, "duplicate golden record id " + record.id());
    }
  }
  return Result::Ok();
}

Result MemoryResolutionSink::WritePairScores(Transaction& t, const std::vector<resolver::v1::PairScore>& scores) {
  auto& state = TX(t).Mutable();
  state.pair_scores.clear();

  for (const auto& score : scores) {
    if (!state.pair_scores.try_emplace({score.id_a(), score.id_b()}, score).second) {
      return Result::Err(ErrorCode::ConstraintViolation,
                         "duplicate pair score " + score.id_a() + "/" + score.id_b());
    }
  }
  return Result::Ok();
}

std::vector<resolver::v1::GoldenRecord> MemoryResolutionSink::ReadGoldenRecords() {
  std::scoped_lock lock(mutex_);

  std::vector<resolver::v1::GoldenRecord> out;
  out.reserve(committed_.golden_records.size());
  for (const auto& [id, record] : committed_.golden_records) {
    out.push_back(record);
  }
  return out;
}

std::vector<resolver::v1::PairScore> MemoryResolutionSink::ReadPairScores() {
  std::scoped_lock lock(mutex_);

  std::vector<resolver::v1::PairScore> out;
  out.reserve(committed_.pair_scores.size());
  for (const auto& [key, score] : committed_.pair_scores) {
    out.push_back(score);
  }
  return out;
}

} // namespace resolver::store::memory
