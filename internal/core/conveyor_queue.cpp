#include "conveyor_queue.hpp"

namespace warehouse::core {

void ConveyorQueue::Enqueue(const model::Package& pkg) {
  std::lock_guard lock(mutex_);
  queue_.push(pkg);
}

std::optional<model::Package> ConveyorQueue::Dequeue() {
  std::lock_guard lock(mutex_);

  if (queue_.empty()) return std::nullopt;

  model::Package pkg = std::move(queue_.front());
  queue_.pop();
  return pkg;
}

std::size_t ConveyorQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

bool ConveyorQueue::Empty() const {
  std::lock_guard lock(mutex_);
  return queue_.empty();
}

} // namespace warehouse::core
