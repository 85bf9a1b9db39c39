#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace warehouse::db::model {

/*
  Append-only shipment log row.

  bin_id is NULL for truck events.
  timestamp is ISO-8601 local time as written by util::ToIsoString.
*/

struct ShipmentLogRecord {
  std::string                 tracking_id;
  std::optional<std::int64_t> bin_id;
  std::string                 timestamp;
  std::string                 status;
};

}
