#pragma once

namespace warehouse::db {

/*
  Unit of work against a Repository.

  Every bin usage update and every shipment log append runs inside one.
  Backends must guarantee:

  - writes are visible to reads in the same transaction
  - nothing is visible to other transactions before Commit()
  - a transaction destroyed without Commit() is rolled back

  SQLite:   BEGIN IMMEDIATE (one writer per connection)
  Postgres: pqxx::work on a pooled connection
  Memory:   private copy of the committed state, swapped in on Commit()
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws if the backend refuses the commit (conflict, I/O error).
  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace warehouse::db
