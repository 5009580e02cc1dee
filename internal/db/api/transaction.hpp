#pragma once

#include <stdexcept>
#include <string>

namespace engram::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Pointer compare-and-swaps performed inside the transaction still hold
    at Commit(), otherwise Commit() throws TransactionConflict and nothing
    is applied

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work, conditional UPDATE
  Memory: snapshot + write log, swaps re-validated at commit
*/

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() completed
  virtual bool IsCommitted() const = 0;
};

} // namespace engram::db
