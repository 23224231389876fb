#include "pg_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace resolver::store::postgres {

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw util::BackendError("failed to render payload as JSON: " + status.ToString());
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::BackendError("corrupt JSON payload: " + status.ToString());
  }
}

} // namespace

PgResolutionSink::PgResolutionSink(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<Transaction> PgResolutionSink::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgResolutionSink::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgResolutionSink::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgResolutionSink::WriteGoldenRecords(Transaction& t, const std::vector<resolver::v1::GoldenRecord>& records) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM golden_records;");

    for (const auto& record : records) {
      const auto& rep = record.representative();
      work.exec_prepared("insert_golden_record", record.id(), rep.manufacturer(), rep.part_number(), rep.unspsc(), record.member_ids_size(), ToJson(record));
      for (const auto& member : record.member_ids()) {
        work.exec_prepared("insert_golden_member", member, record.id());
      }
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgResolutionSink::WritePairScores(Transaction& t, const std::vector<resolver::v1::PairScore>& scores) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM pair_scores;");

    for (const auto& score : scores) {
      work.exec_prepared("insert_pair_score", score.id_a(), score.id_b(), score.overall_score(), ToJson(score));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<resolver::v1::GoldenRecord> PgResolutionSink::ReadGoldenRecords() {
  std::vector<resolver::v1::GoldenRecord> out;
  try {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    auto                   res = tx.exec("SELECT payload::text FROM golden_records ORDER BY id;");
    out.reserve(res.size());
    for (const auto& row : res) {
      resolver::v1::GoldenRecord record;
      FromJson(row[0].c_str(), &record);
      out.push_back(std::move(record));
    }
  } catch (const pqxx::failure& e) {
    throw util::BackendError(std::string("postgres read golden records: ") + e.what());
  }
  return out;
}

std::vector<resolver::v1::PairScore> PgResolutionSink::ReadPairScores() {
  std::vector<resolver::v1::PairScore> out;
  try {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    auto                   res = tx.exec("SELECT payload::text FROM pair_scores ORDER BY id_a,id_b;");
    out.reserve(res.size());
    for (const auto& row : res) {
      resolver::v1::PairScore score;
      FromJson(row[0].c_str(), &score);
      out.push_back(std::move(score));
    }
  } catch (const pqxx::failure& e) {
    throw util::BackendError(std::string("postgres read pair scores: ") + e.what());
  }
  return out;
}

} // namespace resolver::store::postgres
