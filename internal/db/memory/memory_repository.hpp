#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace staging::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result SaveDefinition(Transaction&, const model::ResourceDefinitionRecord&) override;
  std::optional<model::ResourceDefinitionRecord> FindDefinitionByName(Transaction&, const std::string& physical_name) override;
  std::vector<model::ResourceDefinitionRecord> FindActiveDefinitions(Transaction&) override;
  std::vector<model::ResourceDefinitionRecord> FindActiveDefinitionsByExecution(Transaction&, const std::string& execution_id) override;
  std::vector<model::ResourceDefinitionRecord> FindExpiredDefinitions(Transaction&, uint64_t now_ms) override;

  Result SavePerformanceSample(Transaction&, model::PerformanceSampleRecord& sample) override;
  std::vector<model::PerformanceSampleRecord> FindRecentSamples(Transaction&, const std::string& definition_id, uint64_t since_ms) override;
  std::vector<model::PerformanceSampleRecord> FindSamplesInRange(Transaction&, const std::string& definition_id, uint64_t start_ms,
                                                                uint64_t end_ms) override;
  std::optional<model::PerformanceSampleRecord> FindLatestOptimization(Transaction&, const std::string& definition_id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ResourceDefinitionRecord> definitions;
    // sample_id -> sample, kept ordered so the newest are at the back
    std::map<uint64_t, model::PerformanceSampleRecord> samples;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   next_sample_id_ = 1;
};

} // namespace staging::db::memory
