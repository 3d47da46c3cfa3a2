#pragma once

#include <cstdint>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace courier::db::memory {

/*
  Works on a private copy of the committed state. Commit publishes the copy
  only if no other transaction committed since it was taken; otherwise it
  throws util::InvalidState and the caller's changes are dropped.
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

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                      repo_;
  std::optional<MemoryRepository::State> working_;
  uint64_t                               base_version_ = 0;
  bool                                   committed_    = false;
};

} // namespace courier::db::memory
