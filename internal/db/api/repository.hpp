#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/performance_sample_record.hpp"
#include "internal/db/model/resource_definition_record.hpp"

namespace staging::db {

/*
  Repository abstraction.

  - All reads and writes go through a Transaction
  - Definitions are keyed by identity and unique by physical name
  - Samples are append-only; sample queries return newest first

  The repository is the source of truth for which staging resources
  exist. The in-memory active index is rebuilt from it.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Resource definitions
  // ---------------------------------------------------------------------

  // Upsert by id. A dropped timestamp already stored is kept.
  virtual Result SaveDefinition(Transaction&, const model::ResourceDefinitionRecord&) = 0;

  virtual std::optional<model::ResourceDefinitionRecord> FindDefinitionByName(Transaction&, const std::string& physical_name) = 0;

  virtual std::vector<model::ResourceDefinitionRecord> FindActiveDefinitions(Transaction&) = 0;

  virtual std::vector<model::ResourceDefinitionRecord> FindActiveDefinitionsByExecution(Transaction&, const std::string& execution_id) = 0;

  // Active, TTL set, created_at + TTL <= now, and an auto-cleanup policy.
  virtual std::vector<model::ResourceDefinitionRecord> FindExpiredDefinitions(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Performance samples
  // ---------------------------------------------------------------------

  // Assigns sample.sample_id.
  virtual Result SavePerformanceSample(Transaction&, model::PerformanceSampleRecord& sample) = 0;

  // measured_at_ms >= since_ms
  virtual std::vector<model::PerformanceSampleRecord> FindRecentSamples(Transaction&, const std::string& definition_id, uint64_t since_ms) = 0;

  // start_ms <= measured_at_ms <= end_ms
  virtual std::vector<model::PerformanceSampleRecord> FindSamplesInRange(Transaction&, const std::string& definition_id, uint64_t start_ms,
                                                                        uint64_t end_ms) = 0;

  // Newest OPTIMIZATION_APPLIED sample.
  virtual std::optional<model::PerformanceSampleRecord> FindLatestOptimization(Transaction&, const std::string& definition_id) = 0;
};

} // namespace staging::db
