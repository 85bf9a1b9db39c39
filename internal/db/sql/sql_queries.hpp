#pragma once

namespace warehouse::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres prepares the same statements with $n placeholders
  (see PgPool::PrepareStatements).
*/

// bins

static constexpr const char* INSERT_BIN =
    "INSERT INTO bins(bin_id,capacity,current_usage,location_code)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_BIN =
    "SELECT bin_id,capacity,current_usage,location_code"
    " FROM bins WHERE bin_id=?;";

static constexpr const char* SELECT_BINS =
    "SELECT bin_id,capacity,current_usage,location_code"
    " FROM bins ORDER BY bin_id;";

static constexpr const char* UPDATE_BIN_USAGE =
    "UPDATE bins SET current_usage=? WHERE bin_id=?;";

static constexpr const char* DELETE_BINS =
    "DELETE FROM bins;";

// shipment log

static constexpr const char* INSERT_SHIPMENT_LOG =
    "INSERT INTO shipment_logs(tracking_id,bin_id,timestamp,status)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_SHIPMENT_LOGS =
    "SELECT tracking_id,bin_id,timestamp,status"
    " FROM shipment_logs ORDER BY seq;";

}
