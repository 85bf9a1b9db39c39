#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace warehouse::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Bins
// ------------------------------------------------------------------

Result MemoryRepository::InsertBin(Transaction& t, const model::BinRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.bins.contains(r.bin_id)) return Result::Err(ErrorCode::AlreadyExists, "bin " + std::to_string(r.bin_id));
  s.bins[r.bin_id] = r;
  return Result::Ok();
}

std::optional<model::BinRecord> MemoryRepository::GetBin(Transaction& t, std::int64_t bin_id) {
  const auto& s  = TX(t).View();
  auto        it = s.bins.find(bin_id);
  if (it == s.bins.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BinRecord> MemoryRepository::ListBins(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::BinRecord> records;
  records.reserve(s.bins.size());
  for (const auto& [_, record] : s.bins) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateBinUsage(Transaction& t, std::int64_t bin_id, std::int64_t current_usage) {
  auto& s  = TX(t).Mutable();
  auto  it = s.bins.find(bin_id);
  if (it == s.bins.end()) return Result::Err(ErrorCode::NotFound, "bin " + std::to_string(bin_id));
  it->second.current_usage = current_usage;
  return Result::Ok();
}

Result MemoryRepository::DeleteAllBins(Transaction& t) {
  TX(t).Mutable().bins.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Shipment log
// ------------------------------------------------------------------

Result MemoryRepository::InsertShipmentLog(Transaction& t, const model::ShipmentLogRecord& r) {
  TX(t).Mutable().shipment_logs.push_back(r);
  return Result::Ok();
}

std::vector<model::ShipmentLogRecord> MemoryRepository::ListShipmentLogs(Transaction& t) {
  return TX(t).View().shipment_logs;
}

} // namespace warehouse::db::memory
