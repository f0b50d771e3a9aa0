#include "memory_tx.hpp"

#include <stdexcept>

namespace taskpilot::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) throw std::logic_error("memory transaction already finished");
  wrote_ = true;
  return working_;
}

void MemoryTransaction::Commit() {
  if (finished_) throw std::logic_error("memory transaction already finished");

  if (wrote_) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != base_version_) {
      throw std::runtime_error("task state changed since this transaction began");
    }
    repo_.committed_ = std::move(working_);
    ++repo_.committed_version_;
  }
  committed_ = true;
  finished_  = true;
}

void MemoryTransaction::Rollback() {
  working_  = {};
  finished_ = true;
}

} // namespace taskpilot::db::memory
