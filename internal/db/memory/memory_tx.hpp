#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace actions::db::memory {

/*
  Transaction = repository lock + snapshot copy

  Transactions are serialized on the repository mutex for their whole
  lifetime, so commits never conflict; the snapshot is what Rollback()
  throws away.
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

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         committed_ = false;
};

} // namespace actions::db::memory
