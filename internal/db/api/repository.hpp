#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/bin_record.hpp"
#include "internal/db/model/shipment_log_record.hpp"

namespace warehouse::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Shipment logs are append-only; ListShipmentLogs returns insertion order
  - Writes report failures through Result; reads throw std::runtime_error
    (a missing row is not a failure)

  The DB is the source of truth for:
    bin capacity / usage between runs
    the shipment log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Bins
  // ---------------------------------------------------------------------

  virtual Result InsertBin(Transaction&, const model::BinRecord&) = 0;

  virtual std::optional<model::BinRecord> GetBin(Transaction&, std::int64_t bin_id) = 0;

  // Ordered by bin_id.
  virtual std::vector<model::BinRecord> ListBins(Transaction&) = 0;

  virtual Result UpdateBinUsage(Transaction&, std::int64_t bin_id, std::int64_t current_usage) = 0;

  virtual Result DeleteAllBins(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Shipment log
  // ---------------------------------------------------------------------

  virtual Result InsertShipmentLog(Transaction&, const model::ShipmentLogRecord&) = 0;

  virtual std::vector<model::ShipmentLogRecord> ListShipmentLogs(Transaction&) = 0;
};

} // namespace warehouse::db
