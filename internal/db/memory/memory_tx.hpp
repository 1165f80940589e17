#pragma once

#include <unordered_set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace staging::db::memory {

/*
  Transaction = snapshot + write set.

  Reads see the snapshot taken at Begin() plus this transaction's writes.
  Commit merges only the written definitions and samples into the
  committed state, so concurrent transactions touching different
  resources never conflict; the last writer of one definition wins.
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

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void MarkDefinitionWritten(const std::string& id) {
    written_definitions_.insert(id);
  }
  void MarkSampleWritten(uint64_t sample_id) {
    written_samples_.insert(sample_id);
  }

  uint64_t NextSampleId();

 private:
  MemoryRepository&               repo_;
  MemoryRepository::State         working_;
  std::unordered_set<std::string> written_definitions_;
  std::unordered_set<uint64_t>    written_samples_;
  bool                            committed_   = false;
  bool                            rolled_back_ = false;
};

} // namespace staging::db::memory
