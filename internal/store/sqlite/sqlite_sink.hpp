#pragma once

#include <memory>

#include "internal/store/api/resolution_sink.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace resolver::store::sqlite {

/*
  Golden records are stored as serialized protobuf payloads next to the
  columns an operator would filter on (manufacturer, part number, UNSPSC,
  member count). Membership is also denormalized into golden_record_members.
*/
class SqliteResolutionSink final : public ResolutionSink {
 public:
  explicit SqliteResolutionSink(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result WriteGoldenRecords(Transaction&, const std::vector<resolver::v1::GoldenRecord>&) override;
  Result WritePairScores(Transaction&, const std::vector<resolver::v1::PairScore>&) override;

  std::vector<resolver::v1::GoldenRecord> ReadGoldenRecords() override;
  std::vector<resolver::v1::PairScore> ReadPairScores() override;

  std::string Describe() const override;

 private:
  static SqliteTransaction& TX(Transaction&);

  Result Prepare(sqlite3* db, const char* sql, Statement& out);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace resolver::store::sqlite
