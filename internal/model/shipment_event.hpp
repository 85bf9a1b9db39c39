#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warehouse::model {

enum class ShipmentStatus : std::uint8_t {
  kStored  = 1,
  kLoaded  = 2,
  kRemoved = 3,
};

constexpr std::string_view ToString(ShipmentStatus status) {
  switch (status) {
    case ShipmentStatus::kStored:
      return "STORED";
    case ShipmentStatus::kLoaded:
      return "LOADED";
    case ShipmentStatus::kRemoved:
      return "REMOVED";
  }
  return "UNKNOWN";
}

struct ShipmentEvent {
  std::string                           tracking_id;
  std::optional<std::int64_t>           bin_id; // only set for STORED
  ShipmentStatus                        status = ShipmentStatus::kStored;
  std::chrono::system_clock::time_point timestamp{};
};

} // namespace warehouse::model
