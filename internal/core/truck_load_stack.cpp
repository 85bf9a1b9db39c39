#include "truck_load_stack.hpp"

namespace warehouse::core {

void TruckLoadStack::Push(const model::Package& pkg) {
  std::lock_guard lock(mutex_);
  stack_.push_back(pkg);
}

std::optional<model::Package> TruckLoadStack::Pop() {
  std::lock_guard lock(mutex_);

  if (stack_.empty()) return std::nullopt;

  model::Package pkg = std::move(stack_.back());
  stack_.pop_back();
  return pkg;
}

std::optional<model::Package> TruckLoadStack::Top() const {
  std::lock_guard lock(mutex_);

  if (stack_.empty()) return std::nullopt;
  return stack_.back();
}

std::vector<model::Package> TruckLoadStack::Contents() const {
  std::lock_guard lock(mutex_);
  return stack_;
}

std::size_t TruckLoadStack::Size() const {
  std::lock_guard lock(mutex_);
  return stack_.size();
}

bool TruckLoadStack::Empty() const {
  std::lock_guard lock(mutex_);
  return stack_.empty();
}

std::int64_t TruckLoadStack::TotalSize() const {
  std::lock_guard lock(mutex_);

  std::int64_t total = 0;
  for (const auto& pkg : stack_) total += pkg.size;
  return total;
}

} // namespace warehouse::core
