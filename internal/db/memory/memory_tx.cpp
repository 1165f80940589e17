#include "memory_tx.hpp"

#include <stdexcept>

namespace staging::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

uint64_t MemoryTransaction::NextSampleId() {
  std::scoped_lock lock(repo_.mutex_);
  return repo_.next_sample_id_++;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& id : written_definitions_) {
    auto it = working_.definitions.find(id);
    if (it == working_.definitions.end()) {
      continue;
    }
    auto& target = repo_.committed_.definitions[id];
    // a concurrent retirement may have committed first
    auto  dropped = target.dropped_at_ms;
    target        = it->second;
    if (!target.dropped_at_ms && dropped) {
      target.dropped_at_ms = dropped;
    }
  }
  for (auto sample_id : written_samples_) {
    auto it = working_.samples.find(sample_id);
    if (it != working_.samples.end()) {
      repo_.committed_.samples[sample_id] = it->second;
    }
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  written_definitions_.clear();
  written_samples_.clear();
}

} // namespace staging::db::memory
