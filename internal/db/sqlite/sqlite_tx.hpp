#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace warehouse::db::sqlite {

/*
  One BEGIN IMMEDIATE ... COMMIT/ROLLBACK span on a SqliteDB.

  IMMEDIATE takes the write lock up front, so a usage update never fails
  half-way on lock upgrade. A second Begin() on the same connection while
  this one is open throws.

  A failed COMMIT leaves the transaction open; the destructor rolls it back.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  void EnsureOpen() const;

  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace warehouse::db::sqlite
