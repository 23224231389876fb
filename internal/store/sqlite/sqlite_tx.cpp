#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::store::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;

  try {
    db_->Exec("ROLLBACK;");
    RESOLVER_LOG_DEBUG("abandoned sqlite generation rolled back", {observability::StringField("path", db_->Path())});
  } catch (const std::exception& e) {
    RESOLVER_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::RequireOpen(const char* action) const {
  if (state_ != State::kOpen) {
    throw util::BackendError(std::string("cannot ") + action + " a finished sqlite transaction on " + db_->Path());
  }
}

void SqliteTransaction::Commit() {
  RequireOpen("commit");
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ == State::kRolledBack) return;
  RequireOpen("roll back");

  // the destructor never retries a ROLLBACK that was already attempted
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace resolver::store::sqlite
