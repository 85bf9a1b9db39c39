#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace warehouse::db::postgres {

/*
  pqxx::work on a connection checked out of PgPool.

  The connection goes back to the pool when the transaction is destroyed.
  A statement error aborts the whole server-side transaction, so callers
  roll back after any failed Result instead of issuing more statements.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  PgTransaction(const PgTransaction&)            = delete;
  PgTransaction& operator=(const PgTransaction&) = delete;

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  void EnsureOpen() const;

  // Declared before tx_: the work must be destroyed before its connection.
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              committed_ = false;
  bool                              finished_  = false;
};

} // namespace warehouse::db::postgres
