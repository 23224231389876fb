#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/store/api/transaction.hpp"
#include "pg_pool.hpp"

namespace resolver::store::postgres {

/*
  Write transaction for one resolution generation.

  Holds a pooled connection for its whole life and locks the generation
  tables on entry (SHARE ROW EXCLUSIVE: plain reads proceed, a second
  writer waits). Dropped without Commit() it is aborted, and the
  connection goes back to the pool only after the work is gone.
*/
class PgTransaction final : public store::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kOpen, kCommitted, kAborted };

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  State                             state_ = State::kOpen;
};

} // namespace resolver::store::postgres
