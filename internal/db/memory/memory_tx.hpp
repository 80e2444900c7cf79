#pragma once

#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace vigil::db::memory {

/*
  Transaction = snapshot + write log

  Reads see the snapshot taken at Begin() plus this transaction's own
  writes. Commit() replays the write log against the latest committed
  state, so concurrent transactions on disjoint keys both succeed and an
  insert that lost a race fails with AlreadyExists.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

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

  void Record(MemoryRepository::Mutation op) {
    log_.push_back(std::move(op));
  }

 private:
  MemoryRepository&                     repo_;
  MemoryRepository::State               working_;
  std::vector<MemoryRepository::Mutation> log_;
  bool                                  committed_   = false;
  bool                                  rolled_back_ = false;
};

} // namespace vigil::db::memory
