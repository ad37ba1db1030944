#include "memory_tx.hpp"

#include <stdexcept>

namespace ure::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.writer_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (lock_.owns_lock()) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!lock_.owns_lock()) {
    throw std::logic_error("memory transaction already finished");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw std::logic_error("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace ure::db::memory
