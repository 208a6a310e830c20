#pragma once

#include "internal/db/api/session.hpp"
#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace systock::db::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    finished_         = false;
};

class MemorySession final : public db::Session {
 public:
  explicit MemorySession(MemoryRepository& repo) : repo_(repo) {
  }

  std::unique_ptr<Transaction> Begin() override {
    return std::make_unique<MemoryTransaction>(repo_);
  }

 private:
  MemoryRepository& repo_;
};

} // namespace systock::db::memory
