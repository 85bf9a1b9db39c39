#include "migrations.hpp"

namespace warehouse::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS bins (bin_id INTEGER PRIMARY KEY, capacity INTEGER NOT NULL CHECK (capacity > 0), current_usage INTEGER NOT NULL DEFAULT 0, location_code TEXT);",
      "CREATE TABLE IF NOT EXISTS shipment_logs (seq INTEGER PRIMARY KEY AUTOINCREMENT, tracking_id TEXT NOT NULL, bin_id INTEGER, timestamp TEXT NOT NULL, status TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS shipment_logs_tracking_id ON shipment_logs(tracking_id);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS bins (bin_id BIGINT PRIMARY KEY, capacity BIGINT NOT NULL CHECK (capacity > 0), current_usage BIGINT NOT NULL DEFAULT 0, location_code TEXT);",
      "CREATE TABLE IF NOT EXISTS shipment_logs (seq BIGSERIAL PRIMARY KEY, tracking_id TEXT NOT NULL, bin_id BIGINT, timestamp TEXT NOT NULL, status TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS shipment_logs_tracking_id ON shipment_logs(tracking_id);"};
  return kSchema;
}

} // namespace warehouse::db::sql
