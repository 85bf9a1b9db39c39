#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace warehouse::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    WAREHOUSE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::EnsureOpen() const {
  if (finished_) {
    throw std::logic_error("sqlite transaction already finished");
  }
}

void SqliteTransaction::Commit() {
  EnsureOpen();
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  EnsureOpen();
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace warehouse::db::sqlite
