#include "pg_source.hpp"

#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace resolver::store::postgres {

namespace {

resolver::v1::Record ReadRow(const pqxx::row& row) {
  resolver::v1::Record r;
  r.set_id(row[0].c_str());
  r.set_source_key(row[1].c_str());
  r.set_manufacturer_raw(row[2].c_str());
  r.set_part_number_raw(row[3].c_str());
  r.set_title(row[4].c_str());
  r.set_description(row[5].c_str());
  r.set_unspsc(row[6].c_str());
  r.set_gtin(row[7].c_str());
  return r;
}

} // namespace

PgRecordSource::PgRecordSource(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

Result PgRecordSource::Upsert(const resolver::v1::Record& r) {
  util::ValidateId(r.id(), "record id");

  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("upsert_record", r.id(), r.source_key(), r.manufacturer_raw(), r.part_number_raw(), r.title(), r.description(), r.unspsc(), r.gtin());
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

void PgRecordSource::IterateAll(const RecordVisitor& visit) {
  std::vector<resolver::v1::Record> records;
  try {
    auto                  conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    auto                  res = tx.exec_prepared("list_records");
    records.reserve(res.size());
    for (const auto& row : res) {
      records.push_back(ReadRow(row));
    }
  } catch (const pqxx::failure& e) {
    throw util::BackendError(std::string("postgres read records: ") + e.what());
  }

  // Visit outside the connection so a slow visitor does not pin it.
  for (const auto& record : records) {
    visit(record);
  }
}

std::optional<resolver::v1::Record> PgRecordSource::Get(const std::string& id) {
  try {
    auto                  conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    auto                  res = tx.exec_prepared("get_record", id);
    if (res.empty()) return std::nullopt;
    return ReadRow(res[0]);
  } catch (const pqxx::failure& e) {
    throw util::BackendError("postgres read record " + id + ": " + e.what());
  }
}

} // namespace resolver::store::postgres
