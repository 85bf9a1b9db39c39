#pragma once

#include <cstdint>
#include <string>

namespace warehouse::model {

/*
  A parcel moving through the warehouse.

  destination is carried for downstream consumers; allocation ignores it.
*/
struct Package {
  std::string  tracking_id;
  std::int64_t size = 0;
  std::string  destination;
};

inline bool operator==(const Package& a, const Package& b) {
  return a.tracking_id == b.tracking_id && a.size == b.size && a.destination == b.destination;
}

} // namespace warehouse::model
