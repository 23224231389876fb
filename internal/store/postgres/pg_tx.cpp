#include "pg_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::store::postgres {

namespace {

constexpr const char* kLockGenerationTables = "LOCK TABLE golden_records, golden_record_members, pair_scores IN SHARE ROW EXCLUSIVE MODE;";

} // namespace

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*conn_, "resolver_generation");
  work_->exec(kLockGenerationTables);
}

PgTransaction::~PgTransaction() {
  if (state_ == State::kOpen) {
    try {
      work_->abort();
      RESOLVER_LOG_DEBUG("abandoned postgres generation aborted");
    } catch (const std::exception& e) {
      RESOLVER_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
  work_.reset();
}

pqxx::work& PgTransaction::Work() {
  if (state_ != State::kOpen) {
    throw util::BackendError("postgres generation transaction is already finished");
  }
  return *work_;
}

void PgTransaction::Commit() {
  Work().commit();
  state_ = State::kCommitted;
}

void PgTransaction::Rollback() {
  if (state_ == State::kAborted) return;

  auto& work = Work();
  state_     = State::kAborted;
  work.abort();
}

} // namespace resolver::store::postgres
