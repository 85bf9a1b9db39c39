#pragma once

#include <cstdint>
#include <string>

#include "internal/model/result.hpp"

namespace warehouse::model {

/*
  Capability interface for anything that holds packages by volume.

  StorageBin is the only implementation today.
*/
class StorageUnit {
 public:
  virtual ~StorageUnit() = default;

  // Fails with CapacityExceeded (state untouched) if amount does not fit.
  virtual Result OccupySpace(std::int64_t amount) = 0;

  virtual std::int64_t AvailableSpace() const = 0;
};

class StorageBin final : public StorageUnit {
 public:
  StorageBin() = default;
  StorageBin(std::int64_t bin_id, std::int64_t capacity, std::string location_code, std::int64_t used_space = 0);

  Result       OccupySpace(std::int64_t amount) override;
  std::int64_t AvailableSpace() const override;

  // capacity >= size && available >= size
  bool CanHold(std::int64_t size) const;

  // positive capacity, 0 <= used <= capacity
  bool IsValid() const;

  std::int64_t BinId() const {
    return bin_id_;
  }
  std::int64_t Capacity() const {
    return capacity_;
  }
  std::int64_t UsedSpace() const {
    return used_space_;
  }
  const std::string& LocationCode() const {
    return location_code_;
  }

 private:
  std::int64_t bin_id_     = 0;
  std::int64_t capacity_   = 0;
  std::int64_t used_space_ = 0;
  std::string  location_code_;
};

// Registry order: capacity ascending, then bin id.
struct CapacityOrder {
  bool operator()(const StorageBin& a, const StorageBin& b) const {
    if (a.Capacity() != b.Capacity()) return a.Capacity() < b.Capacity();
    return a.BinId() < b.BinId();
  }
};

} // namespace warehouse::model
