#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/exec/sql_executor.hpp"
#include "internal/model/staging_types.hpp"
#include "internal/util/time.hpp"

namespace staging::perf {

struct AnalyzerPolicy {
  uint32_t analysis_window_hours  = 4;
  double   slow_query_threshold_ms = 10'000.0;
  double   high_memory_threshold_mb = 1024.0;
  // strictly greater than this share of errored samples
  double error_rate_threshold = 0.10;
  double memory_ceiling_mb    = 2048.0;
  double io_ceiling_mb        = 1024.0;

  double   index_recommend_min_duration_ms     = 5000.0;
  uint64_t partition_recommend_min_records     = 10'000'000;
  double   compression_recommend_min_size_mb   = 1000.0;
  double   compression_recommend_max_io_percent = 50.0;
  double   memory_recommend_min_percent        = 80.0;
  uint32_t archival_recommend_min_age_days     = 7;

  uint32_t improvement_baseline_start_hours = 24;
  uint32_t improvement_baseline_end_hours   = 2;
  uint32_t improvement_recent_hours         = 2;

  uint32_t summary_window_hours       = 2;
  uint32_t memory_window_hours        = 1;
  double   slow_operation_threshold_ms = 30'000.0;
  double   high_usage_memory_mb       = 2048.0;
  double   high_usage_cpu_percent     = 80.0;
  double   high_usage_io_mb           = 1024.0;
};

struct PerformanceStats {
  std::size_t sample_count        = 0;
  std::size_t error_count         = 0;
  double      average_duration_ms = 0.0;
  uint64_t    total_records       = 0;
  double      average_memory_mb   = 0.0;
  double      table_size_mb       = 0.0;
  uint32_t    oldest_sample_age_days = 0;
};

// Percent of the configured ceilings.
struct ResourceUtilization {
  double memory_percent = 0.0;
  double io_percent     = 0.0;
};

struct AnalysisResult {
  std::string                physical_name;
  std::string                definition_id;
  std::optional<std::string> error;
  bool                       definition_missing = false;

  PerformanceStats              stats;
  std::vector<model::Bottleneck> bottlenecks;
  ResourceUtilization           utilization;
  bool                          partitioned = false;

  bool HasError() const {
    return error.has_value();
  }

  bool HasBottleneck(model::Bottleneck bottleneck) const {
    for (auto b : bottlenecks) {
      if (b == bottleneck) {
        return true;
      }
    }
    return false;
  }
};

struct OptimizationRecommendation {
  model::RecommendationType     type;
  std::string                   description;
  model::RecommendationPriority priority;
  // fraction, 0.30 means 30%
  double expected_improvement = 0.0;
};

struct OptimizationReport {
  std::string                             physical_name;
  std::vector<OptimizationRecommendation> recommendations;
  std::vector<std::string>                applied;
  double                                  improvement_percent = 0.0;
  double                                  duration_ms         = 0.0;
};

struct ExecutionSummary {
  std::string execution_id;
  std::size_t active_resources = 0;
  uint64_t    total_records    = 0;
  double      total_size_mb    = 0.0;

  double                   average_optimization_score = 0.0;
  std::vector<std::string> bottlenecks;

  double      total_memory_mb       = 0.0;
  double      average_memory_mb     = 0.0;
  std::size_t samples_with_memory   = 0;
  double      total_io_read_mb      = 0.0;
  double      total_io_write_mb     = 0.0;
  std::size_t samples_with_io       = 0;
};

/*
  Reads the sample ledger of a staging resource and turns it into
  statistics, bottleneck tags and optimization recommendations.

  Apply() issues the mechanical part of a recommendation against the
  executor and records an OPTIMIZATION_APPLIED sample. It never holds a
  repository transaction while a statement runs.
*/
class PerformanceAnalyzer {
 public:
  PerformanceAnalyzer(std::shared_ptr<db::Repository> repository, std::shared_ptr<exec::SqlExecutor> executor, AnalyzerPolicy policy = {});

  // Missing definitions come back as an error result, never as an exception.
  AnalysisResult Analyze(const std::string& physical_name, util::TimePoint now = util::Now()) const;

  std::vector<OptimizationRecommendation> Recommend(const AnalysisResult& analysis) const;

  // Percent change between the baseline window average duration and the
  // recent window average duration. 0 when either window is empty or the
  // samples cannot be read.
  double ComputeImprovement(const std::string& definition_id, util::TimePoint now = util::Now()) const;

  // false when the action failed or is not applicable; nothing escapes.
  bool Apply(const std::string& physical_name, const OptimizationRecommendation& recommendation, double improvement_percent,
             util::TimePoint now = util::Now());

  // A repository failure yields an empty summary for the execution.
  ExecutionSummary Summarize(const std::string& execution_id, util::TimePoint now = util::Now()) const;

  const AnalyzerPolicy& Policy() const {
    return policy_;
  }

 private:
  ExecutionSummary CollectSummary(const std::string& execution_id, util::TimePoint now) const;

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<exec::SqlExecutor> executor_;
  AnalyzerPolicy                     policy_;
};

} // namespace staging::perf
