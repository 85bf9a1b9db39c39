#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/model/package.hpp"
#include "internal/model/result.hpp"
#include "internal/model/storage_bin.hpp"

namespace warehouse::core {

/*
  In-memory bin set kept in CapacityOrder (capacity asc, bin id asc).

  Ordering invariant:
  - Sorted once per Load().
  - Occupy() only changes used space, and capacity is immutable,
    so the order never needs to be rebuilt between loads.

  All access is serialized on one mutex so a bin's usage is never
  observed half-updated.
*/
class BinRegistry {
 public:
  // Replaces the current set. Invalid bins and repeated ids are dropped
  // (first occurrence wins). Returns the number of bins kept.
  std::size_t Load(std::vector<model::StorageBin> bins);

  /*
    Best-fit lookup.

    Binary search over the capacity order. A midpoint that can hold the
    package is remembered and the search continues to its left looking for
    a smaller bin; a midpoint that cannot (too small, or too full) moves the
    search to its right. Availability is only evaluated at visited
    midpoints, so a qualifying bin on the far side of a full one can be
    missed when usage is uneven across equal capacities.
  */
  std::optional<model::StorageBin> FindBestFit(const model::Package& pkg) const;

  // CapacityExceeded leaves the bin untouched; UnknownBin if id not loaded.
  // On success, used_after (if given) receives the bin's usage read under
  // the same lock as the update.
  model::Result Occupy(std::int64_t bin_id, std::int64_t amount, std::int64_t* used_after = nullptr);

  std::optional<model::StorageBin> Get(std::int64_t bin_id) const;

  // Copy in registry order.
  std::vector<model::StorageBin> Snapshot() const;

  std::size_t Size() const;

 private:
  mutable std::mutex                            mutex_;
  std::vector<model::StorageBin>                bins_;
  std::unordered_map<std::int64_t, std::size_t> index_by_id_;
};

} // namespace warehouse::core
