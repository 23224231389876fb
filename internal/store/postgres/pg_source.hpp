#pragma once

#include <memory>

#include "internal/store/api/record_source.hpp"
#include "internal/store/api/result.hpp"
#include "pg_pool.hpp"

namespace resolver::store::postgres {

class PgRecordSource final : public RecordSource {
 public:
  explicit PgRecordSource(std::shared_ptr<PgPool> pool);

  Result Upsert(const resolver::v1::Record& record);

  void IterateAll(const RecordVisitor& visit) override;
  std::optional<resolver::v1::Record> Get(const std::string& id) override;
  std::string Describe() const override {
    return "postgres";
  }

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace resolver::store::postgres
