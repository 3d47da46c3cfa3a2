#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace courier::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_.emplace(repo_.committed_);
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() = default;

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) throw util::InvalidState("memory transaction already finished");
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  if (!working_) throw util::InvalidState("memory transaction already finished");
  return *working_;
}

void MemoryTransaction::Commit() {
  if (!working_) throw util::InvalidState("memory transaction already finished");

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    working_.reset();
    throw util::InvalidState("memory store changed during the transaction");
  }
  repo_.committed_ = std::move(*working_);
  ++repo_.committed_version_;
  working_.reset();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
}

} // namespace courier::db::memory
