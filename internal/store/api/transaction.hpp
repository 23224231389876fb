#pragma once

namespace resolver::store {

/*
  Abstract sink transaction.

  Semantics guaranteed for ALL backends:

  - Writes are invisible to readers until Commit()
  - Rollback() discards every write of the transaction
  - Destructor rolls back if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy, swapped in on commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace resolver::store
