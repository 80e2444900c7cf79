#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vigil::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  if (!log_.empty()) {
    std::scoped_lock lock(repo_.mutex_);
    MemoryRepository::State next = repo_.committed_;
    for (auto& op : log_) {
      auto result = op(next);
      if (result.code == ErrorCode::AlreadyExists) {
        throw util::AlreadyExists("transaction conflict: " + result.message);
      }
      if (!result) {
        throw std::runtime_error("transaction replay failed: " + result.message);
      }
    }
    repo_.committed_ = std::move(next);
  }

  log_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  log_.clear();
  rolled_back_ = true;
}

} // namespace vigil::db::memory
