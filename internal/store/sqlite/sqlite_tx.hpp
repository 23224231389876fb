#pragma once

#include <memory>

#include "internal/store/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace resolver::store::sqlite {

/*
  Write transaction for one resolution generation.

  BEGIN IMMEDIATE takes the database write lock up front, so a second
  run on the same file fails at Begin() with a busy error rather than
  part way through replacing the previous generation. A transaction
  that is dropped without Commit() is rolled back.
*/
class SqliteTransaction final : public store::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RequireOpen(const char* action) const;

  std::shared_ptr<SqliteDB> db_;
  State                     state_ = State::kOpen;
};

} // namespace resolver::store::sqlite
