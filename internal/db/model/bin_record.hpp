#pragma once

#include <cstdint>
#include <string>

namespace warehouse::db::model {

/*
  Persistent bin row.

  capacity is fixed once inserted; only current_usage changes.
*/

struct BinRecord {
  std::int64_t bin_id        = 0;
  std::int64_t capacity      = 0;
  std::int64_t current_usage = 0;
  std::string  location_code;
};

}
