#pragma once

namespace rulegraph::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::OptimisticLockConflict when a row written by
    this transaction was changed by another one since it began

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot + per-row revision check at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace rulegraph::db
