#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace staging::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace staging::db::postgres
