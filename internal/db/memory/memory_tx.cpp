#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace warehouse::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::EnsureOpen() const {
  if (finished_) {
    throw std::logic_error("memory transaction already finished");
  }
}

void MemoryTransaction::Commit() {
  EnsureOpen();

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("memory transaction conflict: began at version " + std::to_string(base_version_) + ", store is at " +
                             std::to_string(repo_.committed_version_));
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  committed_ = true;
  finished_  = true;
}

void MemoryTransaction::Rollback() {
  EnsureOpen();
  working_  = {};
  finished_ = true;
}

} // namespace warehouse::db::memory
