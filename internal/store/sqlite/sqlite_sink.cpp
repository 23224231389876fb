#include "sqlite_sink.hpp"

#include "internal/util/errors.hpp"
#include "sqlite_common.hpp"

namespace resolver::store::sqlite {

SqliteResolutionSink::SqliteResolutionSink(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<Transaction> SqliteResolutionSink::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteResolutionSink::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

std::string SqliteResolutionSink::Describe() const {
  return "sqlite:" + db_->Path();
}

Result SqliteResolutionSink::Prepare(sqlite3* db, const char* sql, Statement& out) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  out.reset(st);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Golden records
// ------------------------------------------------------------------

Result SqliteResolutionSink::WriteGoldenRecords(Transaction& t, const std::vector<resolver::v1::GoldenRecord>& records) {
  auto* db = TX(t).Handle();

  // Members cascade with their golden record.
  if (int rc = sqlite3_exec(db, "DELETE FROM golden_records;", nullptr, nullptr, nullptr); rc != SQLITE_OK) {
    return Translate(db, rc);
  }

  Statement insert_golden;
  Statement insert_member;
  if (auto r = Prepare(db, "INSERT INTO golden_records(id,manufacturer,part_number,unspsc,member_count,payload) VALUES(?,?,?,?,?,?);", insert_golden); !r) {
    return r;
  }
  if (auto r = Prepare(db, "INSERT INTO golden_record_members(record_id,golden_record_id) VALUES(?,?);", insert_member); !r) {
    return r;
  }

  std::string payload;
  for (const auto& record : records) {
    if (!record.SerializeToString(&payload)) {
      return Result::Err(ErrorCode::InternalError, "failed to serialize golden record " + record.id());
    }

    sqlite3_reset(insert_golden.get());
    BindText(insert_golden.get(), 1, record.id());
    BindText(insert_golden.get(), 2, record.representative().manufacturer());
    BindText(insert_golden.get(), 3, record.representative().part_number());
    BindText(insert_golden.get(), 4, record.representative().unspsc());
    sqlite3_bind_int64(insert_golden.get(), 5, record.member_ids_size());
    BindBlob(insert_golden.get(), 6, payload);

    if (auto r = Translate(db, sqlite3_step(insert_golden.get())); !r) {
      return r;
    }

    for (const auto& member : record.member_ids()) {
      sqlite3_reset(insert_member.get());
      BindText(insert_member.get(), 1, member);
      BindText(insert_member.get(), 2, record.id());
      if (auto r = Translate(db, sqlite3_step(insert_member.get())); !r) {
        return r;
      }
    }
  }

  return Result::Ok();
}

std::vector<resolver::v1::GoldenRecord> SqliteResolutionSink::ReadGoldenRecords() {
  auto st = db_->Prepare("SELECT id,payload FROM golden_records ORDER BY id;");

  std::vector<resolver::v1::GoldenRecord> out;
  db_->ReadRows(
      st.get(),
      [&out](sqlite3_stmt* row) {
        auto& record = out.emplace_back();
        if (!record.ParseFromString(ColBlob(row, 1))) {
          throw util::BackendError("corrupt golden record payload: " + ColText(row, 0));
        }
      },
      "sqlite read golden records");
  return out;
}

// ------------------------------------------------------------------
// Pair scores
// ------------------------------------------------------------------

Result SqliteResolutionSink::WritePairScores(Transaction& t, const std::vector<resolver::v1::PairScore>& scores) {
  auto* db = TX(t).Handle();

  if (int rc = sqlite3_exec(db, "DELETE FROM pair_scores;", nullptr, nullptr, nullptr); rc != SQLITE_OK) {
    return Translate(db, rc);
  }

  Statement insert;
  if (auto r = Prepare(db, "INSERT INTO pair_scores(id_a,id_b,overall_score,payload) VALUES(?,?,?,?);", insert); !r) {
    return r;
  }

  std::string payload;
  for (const auto& score : scores) {
    if (!score.SerializeToString(&payload)) {
      return Result::Err(ErrorCode::InternalError, "failed to serialize pair score " + score.id_a() + "/" + score.id_b());
    }

    sqlite3_reset(insert.get());
    BindText(insert.get(), 1, score.id_a());
    BindText(insert.get(), 2, score.id_b());
    sqlite3_bind_double(insert.get(), 3, score.overall_score());
    BindBlob(insert.get(), 4, payload);

    if (auto r = Translate(db, sqlite3_step(insert.get())); !r) {
      return r;
    }
  }

  return Result::Ok();
}

std::vector<resolver::v1::PairScore> SqliteResolutionSink::ReadPairScores() {
  auto st = db_->Prepare("SELECT id_a,id_b,payload FROM pair_scores ORDER BY id_a,id_b;");

  std::vector<resolver::v1::PairScore> out;
  db_->ReadRows(
      st.get(),
      [&out](sqlite3_stmt* row) {
        auto& score = out.emplace_back();
        if (!score.ParseFromString(ColBlob(row, 2))) {
          throw util::BackendError("corrupt pair score payload: " + ColText(row, 0) + "/" + ColText(row, 1));
        }
      },
      "sqlite read pair scores");
  return out;
}

} // namespace resolver::store::sqlite
