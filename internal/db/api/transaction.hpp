#pragma once

#include <stdexcept>
#include <string>

namespace provenance::db {

// Driver failure a backend cannot express as a Result (I/O, corruption, interrupted step).
class BackendError : public std::runtime_error {
 public:
  explicit BackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another writer holds or changed the state under this transaction.
class TransactionConflict : public BackendError {
 public:
  explicit TransactionConflict(const std::string& msg) : BackendError(msg) {
  }
};

/*
  Abstract transaction. One ledger call == one transaction.

  Semantics guaranteed for ALL backends:

  - Writes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards every write
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace provenance::db
