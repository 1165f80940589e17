#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/core/active_resource_index.hpp"
#include "internal/core/partition_selector.hpp"
#include "internal/core/schema_optimizer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/exec/sql_executor.hpp"
#include "internal/observability/metrics_sink.hpp"
#include "internal/perf/performance_analyzer.hpp"

namespace staging::core {

struct CreationRequest {
  std::string            execution_id;
  std::optional<int64_t> transaction_type_id;
  std::string            schema_json;

  // 0 selects LifecyclePolicy::default_ttl_hours
  uint32_t ttl_hours         = 0;
  uint64_t expected_records  = 0;
  bool     security_required = true;

  std::optional<model::PartitionStrategy> partition_override;
  model::CleanupPolicy                    cleanup_policy = model::CleanupPolicy::kAutoDrop;
};

struct LifecyclePolicy {
  uint32_t    max_concurrent_creations = 20;
  std::string table_prefix             = "STG";
  uint32_t    default_ttl_hours        = 24;
  // encryption failures abort the creation instead of being tolerated
  bool encryption_mandatory = false;
};

/*
  Orchestrates the life of staging tables.

  Create:  admission gate -> validation -> partition + schema decision ->
           DDL -> definition commit -> active index + metrics.
  Retire:  DROP -> dropped timestamp commit -> archive sample -> index
           erase + metrics. Never throws. A failed drop writes no archive
           sample, so retries archive exactly once.
  Optimize: analysis -> recommendations -> Apply() per recommendation.

  The repository is authoritative. The active index is rebuilt from it by
  HydrateIndex() and kept in step with every successful commit here.
  Statements never run while a repository transaction is open.
*/
class LifecycleManager {
 public:
  LifecycleManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<exec::SqlExecutor> executor,
                   std::shared_ptr<observability::MetricsSink> metrics, std::shared_ptr<perf::PerformanceAnalyzer> analyzer,
                   LifecyclePolicy policy = {}, PartitionSelector selector = PartitionSelector{}, SchemaOptimizer optimizer = SchemaOptimizer{});

  // Throws util::CapacityError, util::ValidationError or util::CreationError.
  db::model::ResourceDefinitionRecord Create(const CreationRequest& request);

  // false when the resource is unknown, already retired or could not be
  // dropped; the reason is logged.
  bool Retire(const std::string& physical_name, const std::string& reason);

  // Throws util::NotFound for an unknown resource.
  perf::OptimizationReport Optimize(const std::string& physical_name);

  perf::AnalysisResult Analyze(const std::string& physical_name) const;

  // Also publishes the active memory gauge.
  perf::ExecutionSummary GetMetrics(const std::string& execution_id);

  // Rebuilds the active index from the repository. Failures leave an empty
  // index and are logged. Returns the number of active resources loaded.
  std::size_t HydrateIndex();

  std::vector<db::model::ResourceDefinitionRecord> FindExpired(util::TimePoint now) const;
  std::vector<db::model::ResourceDefinitionRecord> ListActive() const;

  // Optimized schema of an active resource, decoded from its definition on
  // first use.
  std::shared_ptr<const model::TableSchema> ResolveSchema(const std::string& physical_name);

  const ActiveResourceIndex& Index() const {
    return index_;
  }

  std::size_t InFlightCreations() const {
    return in_flight_.load();
  }

 private:
  std::string PhysicalName(const std::string& execution_id, int64_t transaction_type_id, util::TimePoint now);
  void        DropQuietly(const std::string& physical_name);
  void        PublishActiveCount();

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<exec::SqlExecutor>          executor_;
  std::shared_ptr<observability::MetricsSink> metrics_;
  std::shared_ptr<perf::PerformanceAnalyzer>  analyzer_;

  LifecyclePolicy   policy_;
  PartitionSelector selector_;
  SchemaOptimizer   optimizer_;

  ActiveResourceIndex index_;

  std::atomic<uint32_t> in_flight_{0};
  std::atomic<uint64_t> name_seq_{0};

  // Names with a retirement in progress.
  std::mutex                      retiring_mutex_;
  std::unordered_set<std::string> retiring_;
};

} // namespace staging::core
