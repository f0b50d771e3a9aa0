#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace taskpilot::db::memory {

/*
  Private copy of the committed state taken at Begin().

  Only a transaction that asked for Mutable() state publishes on Commit().
  A writer whose snapshot is older than the committed version is rejected,
  so two interleaved writers cannot lose each other's updates. Read-only
  transactions never conflict and leave the version untouched.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::uint64_t           base_version_ = 0;
  bool                    wrote_        = false;
  bool                    committed_    = false;
  bool                    finished_     = false;
};

} // namespace taskpilot::db::memory
