#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace warehouse::db::memory {

/*
  Private copy of the committed bins and shipment log.

  Reads and writes go to the copy. Commit() swaps it in only if no other
  transaction committed since Begin(); otherwise it throws and the copy
  is discarded with the transaction.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void EnsureOpen() const;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::uint64_t           base_version_ = 0;
  bool                    committed_    = false;
  bool                    finished_     = false;
};

} // namespace warehouse::db::memory
