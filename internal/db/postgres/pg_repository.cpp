#include "pg_repository.hpp"

namespace warehouse::db::postgres {

namespace {

model::BinRecord ReadBin(const pqxx::row& row) {
  model::BinRecord r;
  r.bin_id        = row[0].as<std::int64_t>();
  r.capacity      = row[1].as<std::int64_t>();
  r.current_usage = row[2].as<std::int64_t>();
  r.location_code = row[3].is_null() ? std::string{} : row[3].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Bins
// ------------------------------------------------------------------

Result PgRepository::InsertBin(Transaction& t, const model::BinRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_bin", r.bin_id, r.capacity, r.current_usage, r.location_code);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BinRecord> PgRepository::GetBin(Transaction& t, std::int64_t bin_id) {
  auto res = TX(t).Work().exec_prepared("get_bin", bin_id);
  if (res.empty()) return std::nullopt;
  return ReadBin(res[0]);
}

std::vector<model::BinRecord> PgRepository::ListBins(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_bins");

  std::vector<model::BinRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadBin(row));
  }
  return records;
}

Result PgRepository::UpdateBinUsage(Transaction& t, std::int64_t bin_id, std::int64_t current_usage) {
  try {
    auto res = TX(t).Work().exec_prepared("update_bin_usage", bin_id, current_usage);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "bin " + std::to_string(bin_id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteAllBins(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM bins;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Shipment log
// ------------------------------------------------------------------

Result PgRepository::InsertShipmentLog(Transaction& t, const model::ShipmentLogRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_shipment_log", r.tracking_id, r.bin_id, r.timestamp, r.status);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ShipmentLogRecord> PgRepository::ListShipmentLogs(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_shipment_logs");

  std::vector<model::ShipmentLogRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    model::ShipmentLogRecord r;
    r.tracking_id = row[0].c_str();
    if (!row[1].is_null()) r.bin_id = row[1].as<std::int64_t>();
    r.timestamp = row[2].c_str();
    r.status    = row[3].c_str();
    records.push_back(std::move(r));
  }
  return records;
}

} // namespace warehouse::db::postgres
