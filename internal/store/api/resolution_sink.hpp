#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/store/api/result.hpp"
#include "internal/store/api/transaction.hpp"
#include "resolver/v1/types.pb.h"

namespace resolver::store {

/*
  Persistence boundary.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - WriteGoldenRecords / WritePairScores replace the previous generation
    wholesale; nothing of an uncommitted run is ever visible to readers
  - Read* return the last committed generation, golden records by id and
    pair scores by (id_a, id_b)
*/
class ResolutionSink {
 public:
  virtual ~ResolutionSink() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result WriteGoldenRecords(Transaction&, const std::vector<resolver::v1::GoldenRecord>&) = 0;

  virtual Result WritePairScores(Transaction&, const std::vector<resolver::v1::PairScore>&) = 0;

  // I/O failures throw util::BackendError.
  virtual std::vector<resolver::v1::GoldenRecord> ReadGoldenRecords() = 0;

  virtual std::vector<resolver::v1::PairScore> ReadPairScores() = 0;

  virtual std::string Describe() const = 0;
};

} // namespace resolver::store
