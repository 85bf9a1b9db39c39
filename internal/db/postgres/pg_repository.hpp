#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace warehouse::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBin(Transaction&, const model::BinRecord&) override;
  std::optional<model::BinRecord> GetBin(Transaction&, std::int64_t bin_id) override;
  std::vector<model::BinRecord> ListBins(Transaction&) override;
  Result UpdateBinUsage(Transaction&, std::int64_t bin_id, std::int64_t current_usage) override;
  Result DeleteAllBins(Transaction&) override;

  Result InsertShipmentLog(Transaction&, const model::ShipmentLogRecord&) override;
  std::vector<model::ShipmentLogRecord> ListShipmentLogs(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
