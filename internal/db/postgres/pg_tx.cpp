#include "pg_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace warehouse::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), tx_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (finished_) return;

  try {
    tx_->abort();
  } catch (const std::exception& e) {
    WAREHOUSE_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::EnsureOpen() const {
  if (finished_) {
    throw std::logic_error("postgres transaction already finished");
  }
}

void PgTransaction::Commit() {
  EnsureOpen();
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  EnsureOpen();
  finished_ = true;
  tx_->abort();
}

} // namespace warehouse::db::postgres
