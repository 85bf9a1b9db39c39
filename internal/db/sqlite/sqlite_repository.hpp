#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace warehouse::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBin(Transaction&, const model::BinRecord&) override;
  std::optional<model::BinRecord> GetBin(Transaction&, std::int64_t bin_id) override;
  std::vector<model::BinRecord> ListBins(Transaction&) override;
  Result UpdateBinUsage(Transaction&, std::int64_t bin_id, std::int64_t current_usage) override;
  Result DeleteAllBins(Transaction&) override;

  Result InsertShipmentLog(Transaction&, const model::ShipmentLogRecord&) override;
  std::vector<model::ShipmentLogRecord> ListShipmentLogs(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
