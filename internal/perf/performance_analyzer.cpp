#include "internal/perf/performance_analyzer.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

#include "internal/exec/ddl_builder.hpp"
#include "internal/observability/logging.hpp"

namespace staging::perf {

namespace {

using db::model::PerformanceSampleRecord;
using db::model::ResourceDefinitionRecord;
using model::Bottleneck;
using model::RecommendationPriority;
using model::RecommendationType;
using observability::DoubleField;
using observability::StringField;

constexpr uint64_t kMillisPerDay = 86'400'000ULL;

constexpr const char* kMonitoringSource     = "PERFORMANCE_ANALYZER";
constexpr const char* kRepartitionPending   = "REPARTITION_PENDING";
constexpr const char* kArchivalRequested    = "ARCHIVAL_REQUESTED";
constexpr const char* kMemoryTuningAdvisory = "MEMORY_TUNING_ADVISORY";

uint64_t WindowStart(util::TimePoint now, uint32_t hours) {
  const auto now_ms = util::ToUnixMillis(now);
  const auto span   = util::HoursToMillis(hours);
  return now_ms > span ? now_ms - span : 0;
}

double AverageDuration(const std::vector<PerformanceSampleRecord>& samples) {
  double      total = 0.0;
  std::size_t count = 0;
  for (const auto& sample : samples) {
    if (sample.duration_ms.has_value()) {
      total += *sample.duration_ms;
      ++count;
    }
  }
  return count > 0 ? total / static_cast<double>(count) : 0.0;
}

std::optional<ResourceDefinitionRecord> LoadDefinition(db::Repository& repository, const std::string& physical_name) {
  auto tx         = repository.Begin();
  auto definition = repository.FindDefinitionByName(*tx, physical_name);
  tx->Commit();
  return definition;
}

} // namespace

PerformanceAnalyzer::PerformanceAnalyzer(std::shared_ptr<db::Repository> repository, std::shared_ptr<exec::SqlExecutor> executor,
                                         AnalyzerPolicy policy)
    : repository_(std::move(repository)), executor_(std::move(executor)), policy_(policy) {
  if (!repository_) {
    throw std::invalid_argument("performance analyzer requires a repository");
  }
  if (!executor_) {
    throw std::invalid_argument("performance analyzer requires a sql executor");
  }
}

AnalysisResult PerformanceAnalyzer::Analyze(const std::string& physical_name, util::TimePoint now) const {
  AnalysisResult result;
  result.physical_name = physical_name;

  try {
    auto tx         = repository_->Begin();
    auto definition = repository_->FindDefinitionByName(*tx, physical_name);
    if (!definition.has_value()) {
      tx->Commit();
      result.error              = "resource definition not found";
      result.definition_missing = true;
      return result;
    }

    result.definition_id         = definition->id;
    result.partitioned           = definition->partition_strategy != model::PartitionStrategy::kNone;
    result.stats.table_size_mb   = definition->table_size_mb;

    const auto recent = repository_->FindRecentSamples(*tx, definition->id, WindowStart(now, policy_.analysis_window_hours));
    const auto ledger = repository_->FindRecentSamples(*tx, definition->id, 0);
    tx->Commit();

    auto& stats        = result.stats;
    stats.sample_count = recent.size();

    double      memory_total = 0.0;
    std::size_t memory_count = 0;
    double      io_total     = 0.0;
    std::size_t io_count     = 0;
    for (const auto& sample : recent) {
      stats.total_records += sample.records_processed;
      if (sample.memory_used_mb > 0.0) {
        memory_total += sample.memory_used_mb;
        ++memory_count;
      }
      if (sample.io_read_mb > 0.0 || sample.io_write_mb > 0.0) {
        io_total += sample.io_read_mb + sample.io_write_mb;
        ++io_count;
      }
      if (sample.IsError()) {
        ++stats.error_count;
      }
    }
    stats.average_duration_ms = AverageDuration(recent);
    stats.average_memory_mb   = memory_count > 0 ? memory_total / static_cast<double>(memory_count) : 0.0;

    // ledger is newest first
    if (!ledger.empty()) {
      const auto now_ms    = util::ToUnixMillis(now);
      const auto oldest_ms = ledger.back().measured_at_ms;
      if (now_ms > oldest_ms) {
        stats.oldest_sample_age_days = static_cast<uint32_t>((now_ms - oldest_ms) / kMillisPerDay);
      }
    }

    if (stats.average_duration_ms > policy_.slow_query_threshold_ms) {
      result.bottlenecks.push_back(Bottleneck::kSlowQueries);
    }
    if (stats.average_memory_mb > policy_.high_memory_threshold_mb) {
      result.bottlenecks.push_back(Bottleneck::kHighMemoryUsage);
    }
    if (stats.sample_count > 0 &&
        static_cast<double>(stats.error_count) > static_cast<double>(stats.sample_count) * policy_.error_rate_threshold) {
      result.bottlenecks.push_back(Bottleneck::kHighErrorRate);
    }

    if (policy_.memory_ceiling_mb > 0.0) {
      result.utilization.memory_percent = stats.average_memory_mb / policy_.memory_ceiling_mb * 100.0;
    }
    if (policy_.io_ceiling_mb > 0.0 && io_count > 0) {
      result.utilization.io_percent = io_total / static_cast<double>(io_count) / policy_.io_ceiling_mb * 100.0;
    }
  } catch (const std::exception& e) {
    STAGING_LOG_ERROR("performance analysis failed", {StringField("table", physical_name), StringField("error", e.what())});
    result.error = std::string("analysis failed: ") + e.what();
  }

  return result;
}

std::vector<OptimizationRecommendation> PerformanceAnalyzer::Recommend(const AnalysisResult& analysis) const {
  std::vector<OptimizationRecommendation> out;
  if (analysis.HasError()) {
    return out;
  }

  const auto& stats       = analysis.stats;
  const auto& utilization = analysis.utilization;

  if (stats.average_duration_ms > policy_.index_recommend_min_duration_ms && analysis.HasBottleneck(Bottleneck::kSlowQueries)) {
    out.push_back({RecommendationType::kIndexOptimization, "Add missing indexes to improve query performance", RecommendationPriority::kHigh,
                   0.30});
  }

  if (stats.total_records > policy_.partition_recommend_min_records && !analysis.partitioned) {
    out.push_back({RecommendationType::kPartitioning, "Implement table partitioning for better performance", RecommendationPriority::kMedium,
                   0.25});
  }

  if (stats.table_size_mb > policy_.compression_recommend_min_size_mb &&
      utilization.io_percent < policy_.compression_recommend_max_io_percent) {
    out.push_back({RecommendationType::kCompression, "Enable table compression to reduce storage and improve I/O",
                   RecommendationPriority::kMedium, 0.20});
  }

  if (utilization.memory_percent > policy_.memory_recommend_min_percent) {
    out.push_back({RecommendationType::kMemoryTuning, "Optimize memory usage through query tuning and caching", RecommendationPriority::kHigh,
                   0.15});
  }

  if (stats.oldest_sample_age_days > policy_.archival_recommend_min_age_days) {
    out.push_back({RecommendationType::kArchival, "Archive or purge old data to improve performance", RecommendationPriority::kLow, 0.10});
  }

  return out;
}

double PerformanceAnalyzer::ComputeImprovement(const std::string& definition_id, util::TimePoint now) const {
  std::vector<PerformanceSampleRecord> baseline;
  std::vector<PerformanceSampleRecord> recent;
  try {
    auto tx  = repository_->Begin();
    baseline = repository_->FindSamplesInRange(*tx, definition_id, WindowStart(now, policy_.improvement_baseline_start_hours),
                                               WindowStart(now, policy_.improvement_baseline_end_hours));
    recent   = repository_->FindRecentSamples(*tx, definition_id, WindowStart(now, policy_.improvement_recent_hours));
    tx->Commit();
  } catch (const std::exception& e) {
    STAGING_LOG_ERROR("improvement calculation failed", {StringField("definition_id", definition_id), StringField("error", e.what())});
    return 0.0;
  }

  if (baseline.empty() || recent.empty()) {
    return 0.0;
  }

  const double before = AverageDuration(baseline);
  const double after  = AverageDuration(recent);
  if (before == 0.0) {
    return 0.0;
  }
  return (before - after) / before * 100.0;
}

bool PerformanceAnalyzer::Apply(const std::string& physical_name, const OptimizationRecommendation& recommendation,
                                double improvement_percent, util::TimePoint now) {
  const auto type_name = std::string(model::ToString(recommendation.type));

  try {
    auto definition = LoadDefinition(*repository_, physical_name);
    if (!definition.has_value()) {
      STAGING_LOG_WARN("optimization skipped, resource definition not found",
                       {StringField("table", physical_name), StringField("optimization", type_name)});
      return false;
    }

    const exec::DdlBuilder ddl(executor_->Dialect());
    std::string            marker = type_name;

    auto run = [&](const std::string& statement) {
      auto result = executor_->Execute(statement);
      if (!result) {
        STAGING_LOG_WARN("optimization statement failed",
                         {StringField("table", physical_name), StringField("optimization", type_name), StringField("statement", statement),
                          StringField("code", db::ToString(result.code)), StringField("error", result.message)});
      }
      return static_cast<bool>(result);
    };

    switch (recommendation.type) {
      case RecommendationType::kIndexOptimization:
        if (!run(ddl.PerformanceIndex(physical_name))) {
          return false;
        }
        break;
      case RecommendationType::kPartitioning:
        // Repartitioning rebuilds the table; it is only scheduled here.
        marker = kRepartitionPending;
        STAGING_LOG_INFO("repartitioning scheduled", {StringField("table", physical_name)});
        break;
      case RecommendationType::kCompression: {
        auto statement = ddl.CompressTable(physical_name);
        if (!statement.has_value()) {
          STAGING_LOG_WARN("compression not supported by dialect",
                           {StringField("table", physical_name), StringField("dialect", exec::ToString(ddl.Dialect()))});
          return false;
        }
        if (!run(*statement)) {
          return false;
        }
        break;
      }
      case RecommendationType::kMemoryTuning: {
        auto statement = ddl.CacheTable(physical_name);
        if (!statement.has_value()) {
          marker = kMemoryTuningAdvisory;
          STAGING_LOG_INFO("memory tuning recorded as advisory", {StringField("table", physical_name)});
        } else if (!run(*statement)) {
          return false;
        }
        break;
      }
      case RecommendationType::kArchival:
        marker = kArchivalRequested;
        STAGING_LOG_INFO("archival requested", {StringField("table", physical_name)});
        break;
    }

    PerformanceSampleRecord sample;
    sample.definition_id        = definition->id;
    sample.execution_id         = definition->execution_id;
    sample.kind                 = model::SampleKind::kOptimizationApplied;
    sample.measured_at_ms       = util::ToUnixMillis(now);
    sample.optimization_applied = marker;
    sample.improvement_percent  = improvement_percent;
    sample.monitoring_source    = kMonitoringSource;
    sample.note                 = recommendation.description;

    definition->optimization_applied = marker;
    definition->last_access_at_ms    = sample.measured_at_ms;

    auto tx = repository_->Begin();
    if (auto r = repository_->SavePerformanceSample(*tx, sample); !r) {
      throw std::runtime_error(std::string("record optimization sample: ") + db::ToString(r.code) + " " + r.message);
    }
    if (auto r = repository_->SaveDefinition(*tx, *definition); !r) {
      throw std::runtime_error(std::string("record optimization marker: ") + db::ToString(r.code) + " " + r.message);
    }
    tx->Commit();

    STAGING_LOG_INFO("optimization applied", {StringField("table", physical_name), StringField("optimization", marker),
                                              DoubleField("improvement_percent", improvement_percent)});
    return true;
  } catch (const std::exception& e) {
    STAGING_LOG_ERROR("optimization failed",
                      {StringField("table", physical_name), StringField("optimization", type_name), StringField("error", e.what())});
    return false;
  }
}

ExecutionSummary PerformanceAnalyzer::Summarize(const std::string& execution_id, util::TimePoint now) const {
  try {
    return CollectSummary(execution_id, now);
  } catch (const std::exception& e) {
    STAGING_LOG_ERROR("execution summary failed", {StringField("execution_id", execution_id), StringField("error", e.what())});
    ExecutionSummary empty;
    empty.execution_id = execution_id;
    return empty;
  }
}

ExecutionSummary PerformanceAnalyzer::CollectSummary(const std::string& execution_id, util::TimePoint now) const {
  ExecutionSummary summary;
  summary.execution_id = execution_id;

  auto       tx          = repository_->Begin();
  const auto definitions = repository_->FindActiveDefinitionsByExecution(*tx, execution_id);

  summary.active_resources = definitions.size();

  double      score_total  = 0.0;
  std::size_t score_count  = 0;
  const auto  window_start = WindowStart(now, policy_.summary_window_hours);
  const auto  memory_start = WindowStart(now, policy_.memory_window_hours);

  for (const auto& definition : definitions) {
    summary.total_records += definition.record_count;
    summary.total_size_mb += definition.table_size_mb;

    if (auto latest = repository_->FindLatestOptimization(*tx, definition.id); latest && latest->improvement_percent.has_value()) {
      score_total += *latest->improvement_percent;
      ++score_count;
    }

    for (const auto& sample : repository_->FindRecentSamples(*tx, definition.id, window_start)) {
      const auto& table = definition.physical_name;
      if (sample.duration_ms.has_value() && *sample.duration_ms > policy_.slow_operation_threshold_ms) {
        summary.bottlenecks.push_back(fmt::format("SLOW_OPERATION: Table {}, Operation {}, Duration {:.0f}ms", table,
                                                  model::ToString(sample.kind), *sample.duration_ms));
      }
      if (sample.memory_used_mb > policy_.high_usage_memory_mb || sample.cpu_percent > policy_.high_usage_cpu_percent ||
          sample.io_read_mb + sample.io_write_mb > policy_.high_usage_io_mb) {
        summary.bottlenecks.push_back(fmt::format("HIGH_RESOURCE_USAGE: Table {}, Memory {:.0f}MB, CPU {:.2f}%", table,
                                                  sample.memory_used_mb, sample.cpu_percent));
      }
      if (sample.IsError()) {
        summary.bottlenecks.push_back(fmt::format("ERROR_PATTERN: Table {}, Error {}", table, *sample.error_message));
      }

      if (sample.measured_at_ms < memory_start) {
        continue;
      }
      if (sample.memory_used_mb > 0.0) {
        summary.total_memory_mb += sample.memory_used_mb;
        ++summary.samples_with_memory;
      }
      if (sample.io_read_mb > 0.0 || sample.io_write_mb > 0.0) {
        summary.total_io_read_mb += sample.io_read_mb;
        summary.total_io_write_mb += sample.io_write_mb;
        ++summary.samples_with_io;
      }
    }
  }
  tx->Commit();

  summary.average_optimization_score = score_count > 0 ? score_total / static_cast<double>(score_count) : 0.0;
  summary.average_memory_mb =
      summary.samples_with_memory > 0 ? summary.total_memory_mb / static_cast<double>(summary.samples_with_memory) : 0.0;
  return summary;
}

} // namespace staging::perf
