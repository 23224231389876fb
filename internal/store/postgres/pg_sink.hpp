#pragma once

#include <memory>

#include "internal/store/api/resolution_sink.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace resolver::store::postgres {

/*
  Same table layout as the SQLite sink; payload columns hold the protobuf
  JSON rendering as JSONB so they stay queryable from psql.
*/
class PgResolutionSink final : public ResolutionSink {
 public:
  explicit PgResolutionSink(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result WriteGoldenRecords(Transaction&, const std::vector<resolver::v1::GoldenRecord>&) override;
  Result WritePairScores(Transaction&, const std::vector<resolver::v1::PairScore>&) override;

  std::vector<resolver::v1::GoldenRecord> ReadGoldenRecords() override;
  std::vector<resolver::v1::PairScore> ReadPairScores() override;

  std::string Describe() const override {
    return "postgres";
  }

 private:
  static PgTransaction& TX(Transaction&);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace resolver::store::postgres
