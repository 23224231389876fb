#pragma once

#include <memory>

#include "internal/store/api/record_source.hpp"
#include "internal/store/api/result.hpp"
#include "sqlite_db.hpp"

namespace resolver::store::sqlite {

/*
  Reads records from the `records` table.

  Upsert exists for loaders and tests; the engine only reads.
*/
class SqliteRecordSource final : public RecordSource {
 public:
  explicit SqliteRecordSource(std::shared_ptr<SqliteDB> db);

  Result Upsert(const resolver::v1::Record& record);

  void IterateAll(const RecordVisitor& visit) override;
  std::optional<resolver::v1::Record> Get(const std::string& id) override;
  std::string Describe() const override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace resolver::store::sqlite
