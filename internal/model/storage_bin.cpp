#include "storage_bin.hpp"

#include <utility>

namespace warehouse::model {

StorageBin::StorageBin(std::int64_t bin_id, std::int64_t capacity, std::string location_code, std::int64_t used_space)
    : bin_id_(bin_id), capacity_(capacity), used_space_(used_space), location_code_(std::move(location_code)) {
}

Result StorageBin::OccupySpace(std::int64_t amount) {
  if (amount <= 0) {
    return Result::Err(ErrorCode::InvalidArgument, "occupy amount must be positive");
  }
  if (used_space_ + amount > capacity_) {
    return Result::Err(ErrorCode::CapacityExceeded, "bin " + std::to_string(bin_id_) + " full: used " + std::to_string(used_space_) + " + " +
                                                        std::to_string(amount) + " > capacity " + std::to_string(capacity_));
  }
  used_space_ += amount;
  return Result::Ok();
}

std::int64_t StorageBin::AvailableSpace() const {
  return capacity_ - used_space_;
}

bool StorageBin::CanHold(std::int64_t size) const {
  return capacity_ >= size && AvailableSpace() >= size;
}

bool StorageBin::IsValid() const {
  return capacity_ > 0 && used_space_ >= 0 && used_space_ <= capacity_;
}

} // namespace warehouse::model
