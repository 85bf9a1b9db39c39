#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace warehouse::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBin(Transaction&, const model::BinRecord&) override;
  std::optional<model::BinRecord> GetBin(Transaction&, std::int64_t bin_id) override;
  std::vector<model::BinRecord> ListBins(Transaction&) override;
  Result UpdateBinUsage(Transaction&, std::int64_t bin_id, std::int64_t current_usage) override;
  Result DeleteAllBins(Transaction&) override;

  Result InsertShipmentLog(Transaction&, const model::ShipmentLogRecord&) override;
  std::vector<model::ShipmentLogRecord> ListShipmentLogs(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::int64_t, model::BinRecord> bins; // ordered by bin_id
    std::vector<model::ShipmentLogRecord> shipment_logs;
  };

  std::mutex mutex_;
  State committed_;
  std::uint64_t committed_version_ = 0;
};

}
