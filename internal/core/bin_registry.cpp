#include "bin_registry.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/observability/logging.hpp"

namespace warehouse::core {

using model::ErrorCode;
using model::Result;
using model::StorageBin;

std::size_t BinRegistry::Load(std::vector<StorageBin> bins) {
  std::vector<StorageBin>          accepted;
  std::unordered_set<std::int64_t> seen;
  accepted.reserve(bins.size());

  for (auto& bin : bins) {
    if (!bin.IsValid()) {
      WAREHOUSE_LOG_WARN("Skipping invalid bin", {observability::IntField("bin_id", bin.BinId()), observability::IntField("capacity", bin.Capacity()),
                                                  observability::IntField("used", bin.UsedSpace())});
      continue;
    }
    if (!seen.insert(bin.BinId()).second) {
      WAREHOUSE_LOG_WARN("Skipping duplicate bin", {observability::IntField("bin_id", bin.BinId())});
      continue;
    }
    accepted.push_back(std::move(bin));
  }

  std::sort(accepted.begin(), accepted.end(), model::CapacityOrder{});

  std::unordered_map<std::int64_t, std::size_t> index;
  for (std::size_t i = 0; i < accepted.size(); ++i) {
    index.emplace(accepted[i].BinId(), i);
  }

  std::lock_guard lock(mutex_);
  bins_        = std::move(accepted);
  index_by_id_ = std::move(index);
  return bins_.size();
}

std::optional<StorageBin> BinRegistry::FindBestFit(const model::Package& pkg) const {
  std::lock_guard lock(mutex_);

  std::ptrdiff_t    low      = 0;
  std::ptrdiff_t    high     = static_cast<std::ptrdiff_t>(bins_.size()) - 1;
  const StorageBin* best_fit = nullptr;

  while (low <= high) {
    const std::ptrdiff_t mid  = low + (high - low) / 2;
    const StorageBin&    curr = bins_[static_cast<std::size_t>(mid)];

    if (curr.CanHold(pkg.size)) {
      best_fit = &curr;
      high     = mid - 1;
    } else {
      low = mid + 1;
    }
  }

  if (!best_fit) return std::nullopt;
  return *best_fit;
}

Result BinRegistry::Occupy(std::int64_t bin_id, std::int64_t amount, std::int64_t* used_after) {
  std::lock_guard lock(mutex_);

  auto it = index_by_id_.find(bin_id);
  if (it == index_by_id_.end()) {
    return Result::Err(ErrorCode::UnknownBin, "bin " + std::to_string(bin_id) + " is not loaded");
  }

  auto& bin    = bins_[it->second];
  auto  result = bin.OccupySpace(amount);
  if (result && used_after) *used_after = bin.UsedSpace();
  return result;
}

std::optional<StorageBin> BinRegistry::Get(std::int64_t bin_id) const {
  std::lock_guard lock(mutex_);

  auto it = index_by_id_.find(bin_id);
  if (it == index_by_id_.end()) return std::nullopt;
  return bins_[it->second];
}

std::vector<StorageBin> BinRegistry::Snapshot() const {
  std::lock_guard lock(mutex_);
  return bins_;
}

std::size_t BinRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return bins_.size();
}

} // namespace warehouse::core
