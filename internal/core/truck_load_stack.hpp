#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/model/package.hpp"

namespace warehouse::core {

/*
  Packages on the truck, in physical load order (back = last loaded).

  Only Push and Pop mutate; there is no removal from the middle.
*/
class TruckLoadStack {
 public:
  void Push(const model::Package& pkg);

  // nullopt when nothing is loaded.
  std::optional<model::Package> Pop();

  std::optional<model::Package> Top() const;

  // Bottom to top.
  std::vector<model::Package> Contents() const;

  std::size_t  Size() const;
  bool         Empty() const;
  std::int64_t TotalSize() const;

 private:
  mutable std::mutex          mutex_;
  std::vector<model::Package> stack_;
};

} // namespace warehouse::core
