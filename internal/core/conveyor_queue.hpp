#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/model/package.hpp"

namespace warehouse::core {

/*
  Thread-safe FIFO of packages waiting for a bin.

  Non-blocking: the conveyor is drained synchronously, so an empty
  queue ends the drain instead of waiting for more arrivals.
*/
class ConveyorQueue {
 public:
  void Enqueue(const model::Package& pkg);

  std::optional<model::Package> Dequeue();

  std::size_t Size() const;
  bool        Empty() const;

 private:
  mutable std::mutex         mutex_;
  std::queue<model::Package> queue_;
};

} // namespace warehouse::core
