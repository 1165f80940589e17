#include "internal/perf/performance_analyzer.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/lifecycle_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/exec/memory_sql_executor.hpp"
#include "internal/observability/in_memory_metrics.hpp"

namespace {

using staging::db::model::PerformanceSampleRecord;
using staging::db::model::ResourceDefinitionRecord;
using staging::exec::MemorySqlExecutor;
using staging::exec::SqlDialect;
using staging::model::Bottleneck;
using staging::model::PartitionStrategy;
using staging::model::RecommendationPriority;
using staging::model::RecommendationType;
using staging::model::SampleKind;
using staging::perf::AnalysisResult;
using staging::perf::OptimizationRecommendation;
using staging::perf::PerformanceAnalyzer;
using staging::util::TimePoint;

using std::chrono::hours;
using std::chrono::minutes;

const TimePoint kNow = staging::util::FromUnixMillis(1'700'000'000'000ULL);

uint64_t Ms(TimePoint tp) {
  return staging::util::ToUnixMillis(tp);
}

bool Near(double actual, double expected) {
  return std::fabs(actual - expected) < 1e-6;
}

struct Fixture {
  explicit Fixture(SqlDialect dialect = SqlDialect::kOracle)
      : repository(std::make_shared<staging::db::memory::MemoryRepository>()),
        executor(std::make_shared<MemorySqlExecutor>(dialect)),
        analyzer(repository, executor) {
  }

  ResourceDefinitionRecord Define(const std::string& name, const std::string& execution_id = "EXEC-P",
                                  PartitionStrategy partition = PartitionStrategy::kNone) {
    ResourceDefinitionRecord record;
    record.id                  = "def-" + name;
    record.execution_id        = execution_id;
    record.transaction_type_id = 1;
    record.physical_name       = name;
    record.partition_strategy  = partition;
    record.ttl_hours           = 24;
    record.created_at_ms       = Ms(kNow - hours(240));
    Save(record);
    return record;
  }

  void Save(const ResourceDefinitionRecord& record) {
    auto tx = repository->Begin();
    assert(repository->SaveDefinition(*tx, record));
    tx->Commit();
  }

  PerformanceSampleRecord& Add(PerformanceSampleRecord& sample) {
    auto tx = repository->Begin();
    assert(repository->SavePerformanceSample(*tx, sample));
    tx->Commit();
    return sample;
  }

  PerformanceSampleRecord Sample(const ResourceDefinitionRecord& definition, TimePoint at, std::optional<double> duration_ms = std::nullopt,
                                 SampleKind kind = SampleKind::kQueryExecution) {
    PerformanceSampleRecord sample;
    sample.definition_id  = definition.id;
    sample.execution_id   = definition.execution_id;
    sample.kind           = kind;
    sample.measured_at_ms = Ms(at);
    sample.duration_ms    = duration_ms;
    return sample;
  }

  std::optional<ResourceDefinitionRecord> Definition(const std::string& name) {
    auto tx     = repository->Begin();
    auto record = repository->FindDefinitionByName(*tx, name);
    tx->Commit();
    return record;
  }

  std::optional<PerformanceSampleRecord> LatestOptimization(const std::string& definition_id) {
    auto tx     = repository->Begin();
    auto sample = repository->FindLatestOptimization(*tx, definition_id);
    tx->Commit();
    return sample;
  }

  std::shared_ptr<staging::db::memory::MemoryRepository> repository;
  std::shared_ptr<MemorySqlExecutor>                     executor;
  PerformanceAnalyzer                                    analyzer;
};

const OptimizationRecommendation* FindRecommendation(const std::vector<OptimizationRecommendation>& recommendations, RecommendationType type) {
  auto it = std::find_if(recommendations.begin(), recommendations.end(), [type](const auto& r) { return r.type == type; });
  return it == recommendations.end() ? nullptr : &*it;
}

void TestRecommendationThresholds() {
  Fixture fixture;

  AnalysisResult slow;
  slow.stats.average_duration_ms = 6000;
  slow.bottlenecks.push_back(Bottleneck::kSlowQueries);
  auto recommendations = fixture.analyzer.Recommend(slow);
  const auto* index    = FindRecommendation(recommendations, RecommendationType::kIndexOptimization);
  assert(index != nullptr);
  assert(index->priority == RecommendationPriority::kHigh);
  assert(Near(index->expected_improvement, 0.30));

  // slow average without the bottleneck tag is not enough
  AnalysisResult untagged;
  untagged.stats.average_duration_ms = 6000;
  assert(FindRecommendation(fixture.analyzer.Recommend(untagged), RecommendationType::kIndexOptimization) == nullptr);

  AnalysisResult large;
  large.stats.total_records = 11'000'000;
  recommendations           = fixture.analyzer.Recommend(large);
  const auto* partitioning  = FindRecommendation(recommendations, RecommendationType::kPartitioning);
  assert(partitioning != nullptr);
  assert(partitioning->priority == RecommendationPriority::kMedium);
  assert(Near(partitioning->expected_improvement, 0.25));

  large.partitioned = true;
  assert(FindRecommendation(fixture.analyzer.Recommend(large), RecommendationType::kPartitioning) == nullptr);

  AnalysisResult bulky;
  bulky.stats.table_size_mb       = 1500;
  bulky.utilization.io_percent    = 10;
  const auto bulky_recommendations = fixture.analyzer.Recommend(bulky);
  const auto* compression          = FindRecommendation(bulky_recommendations, RecommendationType::kCompression);
  assert(compression != nullptr && compression->priority == RecommendationPriority::kMedium);
  bulky.utilization.io_percent = 60;
  assert(FindRecommendation(fixture.analyzer.Recommend(bulky), RecommendationType::kCompression) == nullptr);

  AnalysisResult hungry;
  hungry.utilization.memory_percent = 85;
  const auto hungry_recommendations = fixture.analyzer.Recommend(hungry);
  const auto* memory                = FindRecommendation(hungry_recommendations, RecommendationType::kMemoryTuning);
  assert(memory != nullptr && memory->priority == RecommendationPriority::kHigh);

  AnalysisResult stale;
  stale.stats.oldest_sample_age_days = 8;
  const auto stale_recommendations = fixture.analyzer.Recommend(stale);
  const auto* archival             = FindRecommendation(stale_recommendations, RecommendationType::kArchival);
  assert(archival != nullptr && archival->priority == RecommendationPriority::kLow);
  stale.stats.oldest_sample_age_days = 7;
  assert(fixture.analyzer.Recommend(stale).empty());

  AnalysisResult failed;
  failed.error                     = "boom";
  failed.stats.average_duration_ms = 60'000;
  failed.bottlenecks.push_back(Bottleneck::kSlowQueries);
  assert(fixture.analyzer.Recommend(failed).empty());
}

void TestAnalyzeWindowAndBottlenecks() {
  Fixture    fixture;
  const auto definition = fixture.Define("STG_ANALYZE");

  for (double duration : {12'000.0, 14'000.0, 13'000.0}) {
    auto sample              = fixture.Sample(definition, kNow - minutes(30), duration);
    sample.memory_used_mb    = 1536;
    sample.records_processed = 1000;
    fixture.Add(sample);
  }
  auto failed          = fixture.Sample(definition, kNow - hours(1));
  failed.error_message = "ORA-01653: unable to extend table";
  failed.io_read_mb    = 100;
  failed.io_write_mb   = 100;
  fixture.Add(failed);

  // outside the 4 hour window, still part of the ledger
  auto old = fixture.Sample(definition, kNow - hours(24 * 10), 500'000.0);
  fixture.Add(old);

  const auto analysis = fixture.analyzer.Analyze("STG_ANALYZE", kNow);
  assert(!analysis.HasError());
  assert(analysis.definition_id == definition.id);
  assert(analysis.stats.sample_count == 4);
  assert(analysis.stats.error_count == 1);
  assert(analysis.stats.total_records == 3000);
  assert(Near(analysis.stats.average_duration_ms, 13'000.0));
  assert(Near(analysis.stats.average_memory_mb, 1536.0));
  assert(analysis.stats.oldest_sample_age_days == 10);
  assert(!analysis.partitioned);

  assert(analysis.HasBottleneck(Bottleneck::kSlowQueries));
  assert(analysis.HasBottleneck(Bottleneck::kHighMemoryUsage));
  assert(analysis.HasBottleneck(Bottleneck::kHighErrorRate));

  assert(Near(analysis.utilization.memory_percent, 75.0));
  assert(Near(analysis.utilization.io_percent, 200.0 / 1024.0 * 100.0));

  const auto recommendations = fixture.analyzer.Recommend(analysis);
  assert(FindRecommendation(recommendations, RecommendationType::kIndexOptimization) != nullptr);
  assert(FindRecommendation(recommendations, RecommendationType::kArchival) != nullptr);
}

void TestErrorRateThresholdIsStrict() {
  Fixture    fixture;
  const auto definition = fixture.Define("STG_ERRORS");

  for (int i = 0; i < 10; ++i) {
    auto sample = fixture.Sample(definition, kNow - minutes(10 + i), 100.0);
    if (i == 0) {
      sample.error_message = "deadlock";
    }
    fixture.Add(sample);
  }
  assert(!fixture.analyzer.Analyze("STG_ERRORS", kNow).HasBottleneck(Bottleneck::kHighErrorRate));

  auto second          = fixture.Sample(definition, kNow - minutes(5), 100.0);
  second.error_message = "deadlock";
  fixture.Add(second);
  assert(fixture.analyzer.Analyze("STG_ERRORS", kNow).HasBottleneck(Bottleneck::kHighErrorRate));
}

void TestAnalyzeMissingDefinition() {
  Fixture    fixture;
  const auto analysis = fixture.analyzer.Analyze("STG_NOPE", kNow);
  assert(analysis.HasError());
  assert(analysis.definition_missing);
  assert(analysis.definition_id.empty());
}

void TestComputeImprovement() {
  Fixture    fixture;
  const auto definition = fixture.Define("STG_IMPROVE");
  assert(fixture.analyzer.ComputeImprovement(definition.id, kNow) == 0.0);

  auto before_a = fixture.Sample(definition, kNow - hours(10), 1000.0);
  auto before_b = fixture.Sample(definition, kNow - hours(5), 1000.0);
  fixture.Add(before_a);
  fixture.Add(before_b);
  // baseline without a recent window is no measurement
  assert(fixture.analyzer.ComputeImprovement(definition.id, kNow) == 0.0);

  auto after = fixture.Sample(definition, kNow - hours(1), 600.0);
  fixture.Add(after);
  assert(Near(fixture.analyzer.ComputeImprovement(definition.id, kNow), 40.0));

  // samples older than the baseline window are ignored
  auto ancient = fixture.Sample(definition, kNow - hours(30), 100'000.0);
  fixture.Add(ancient);
  assert(Near(fixture.analyzer.ComputeImprovement(definition.id, kNow), 40.0));
}

void TestApplyRecordsTheOptimization() {
  Fixture    fixture;
  const auto definition = fixture.Define("STG_APPLY");
  assert(fixture.executor->Execute("CREATE TABLE STG_APPLY (ACCOUNT_ID VARCHAR2(50))"));

  const OptimizationRecommendation index{RecommendationType::kIndexOptimization, "Add missing indexes", RecommendationPriority::kHigh, 0.30};
  assert(fixture.analyzer.Apply("STG_APPLY", index, 12.5, kNow));

  const auto statements = fixture.executor->Statements();
  assert(statements.back() == "CREATE INDEX IDX_STG_APPLY_PERF_OPT ON STG_APPLY (STG_PROCESSING_STATUS, STG_CREATED_TIMESTAMP)");

  auto latest = fixture.LatestOptimization(definition.id);
  assert(latest.has_value());
  assert(latest->kind == SampleKind::kOptimizationApplied);
  assert(latest->optimization_applied == "INDEX_OPTIMIZATION");
  assert(latest->improvement_percent.has_value() && Near(*latest->improvement_percent, 12.5));
  assert(latest->monitoring_source == "PERFORMANCE_ANALYZER");
  assert(latest->note == "Add missing indexes");
  assert(fixture.Definition("STG_APPLY")->optimization_applied == "INDEX_OPTIMIZATION");

  const OptimizationRecommendation partitioning{RecommendationType::kPartitioning, "Partition", RecommendationPriority::kMedium, 0.25};
  assert(fixture.analyzer.Apply("STG_APPLY", partitioning, 0.0, kNow + minutes(1)));
  assert(fixture.LatestOptimization(definition.id)->optimization_applied == "REPARTITION_PENDING");

  const OptimizationRecommendation memory{RecommendationType::kMemoryTuning, "Cache", RecommendationPriority::kHigh, 0.15};
  assert(fixture.analyzer.Apply("STG_APPLY", memory, 0.0, kNow + minutes(2)));
  assert(fixture.executor->Statements().back() == "ALTER TABLE STG_APPLY CACHE");

  const OptimizationRecommendation compression{RecommendationType::kCompression, "Compress", RecommendationPriority::kMedium, 0.20};
  assert(fixture.analyzer.Apply("STG_APPLY", compression, 0.0, kNow + minutes(3)));
  assert(fixture.executor->Statements().back() == "ALTER TABLE STG_APPLY COMPRESS FOR OLTP");

  const OptimizationRecommendation archival{RecommendationType::kArchival, "Archive", RecommendationPriority::kLow, 0.10};
  assert(fixture.analyzer.Apply("STG_APPLY", archival, 0.0, kNow + minutes(4)));
  assert(fixture.Definition("STG_APPLY")->optimization_applied == "ARCHIVAL_REQUESTED");
}

void TestApplyFailuresWriteNothing() {
  const OptimizationRecommendation index{RecommendationType::kIndexOptimization, "Add missing indexes", RecommendationPriority::kHigh, 0.30};
  const OptimizationRecommendation compression{RecommendationType::kCompression, "Compress", RecommendationPriority::kMedium, 0.20};
  const OptimizationRecommendation memory{RecommendationType::kMemoryTuning, "Cache", RecommendationPriority::kHigh, 0.15};

  Fixture oracle;
  assert(!oracle.analyzer.Apply("STG_MISSING", index, 0.0, kNow));

  const auto definition = oracle.Define("STG_FAIL");
  oracle.executor->FailOn("PERF_OPT");
  assert(!oracle.analyzer.Apply("STG_FAIL", index, 0.0, kNow));
  assert(!oracle.LatestOptimization(definition.id).has_value());
  assert(oracle.Definition("STG_FAIL")->optimization_applied.empty());

  Fixture    sqlite(SqlDialect::kSqlite);
  const auto lite = sqlite.Define("STG_LITE");
  assert(!sqlite.analyzer.Apply("STG_LITE", compression, 0.0, kNow));
  assert(!sqlite.LatestOptimization(lite.id).has_value());

  // no CACHE clause outside oracle; recorded as advisory
  assert(sqlite.analyzer.Apply("STG_LITE", memory, 0.0, kNow));
  assert(sqlite.LatestOptimization(lite.id)->optimization_applied == "MEMORY_TUNING_ADVISORY");
}

void TestSummarizeExecution() {
  Fixture fixture;

  auto table_a          = fixture.Define("T_A", "EXEC-S");
  table_a.record_count  = 100;
  table_a.table_size_mb = 10.5;
  fixture.Save(table_a);
  auto table_b          = fixture.Define("T_B", "EXEC-S");
  table_b.record_count  = 50;
  table_b.table_size_mb = 4.5;
  fixture.Save(table_b);
  fixture.Define("T_OTHER", "EXEC-OTHER");
  auto table_gone          = fixture.Define("T_GONE", "EXEC-S");
  table_gone.dropped_at_ms = Ms(kNow - hours(1));
  fixture.Save(table_gone);

  auto slow           = fixture.Sample(table_a, kNow - minutes(30), 45'000.0);
  slow.memory_used_mb = 3000;
  slow.io_read_mb     = 10;
  slow.io_write_mb    = 5;
  fixture.Add(slow);

  auto failed           = fixture.Sample(table_a, kNow - minutes(90));
  failed.memory_used_mb = 500;
  failed.error_message  = "boom";
  fixture.Add(failed);

  auto outside = fixture.Sample(table_a, kNow - hours(5), 60'000.0);
  fixture.Add(outside);

  auto optimized_a                = fixture.Sample(table_a, kNow - hours(3), std::nullopt, SampleKind::kOptimizationApplied);
  optimized_a.improvement_percent = 40.0;
  fixture.Add(optimized_a);

  auto optimized_b                = fixture.Sample(table_b, kNow - minutes(10), std::nullopt, SampleKind::kOptimizationApplied);
  optimized_b.improvement_percent = 20.0;
  fixture.Add(optimized_b);

  auto busy_b           = fixture.Sample(table_b, kNow - minutes(20), 100.0);
  busy_b.memory_used_mb = 1000;
  fixture.Add(busy_b);

  const auto summary = fixture.analyzer.Summarize("EXEC-S", kNow);
  assert(summary.execution_id == "EXEC-S");
  assert(summary.active_resources == 2);
  assert(summary.total_records == 150);
  assert(Near(summary.total_size_mb, 15.0));
  assert(Near(summary.average_optimization_score, 30.0));

  assert(Near(summary.total_memory_mb, 4000.0));
  assert(summary.samples_with_memory == 2);
  assert(Near(summary.average_memory_mb, 2000.0));
  assert(Near(summary.total_io_read_mb, 10.0));
  assert(Near(summary.total_io_write_mb, 5.0));
  assert(summary.samples_with_io == 1);

  const auto has = [&summary](const std::string& text) {
    return std::find(summary.bottlenecks.begin(), summary.bottlenecks.end(), text) != summary.bottlenecks.end();
  };
  assert(summary.bottlenecks.size() == 3);
  assert(has("SLOW_OPERATION: Table T_A, Operation QUERY_EXECUTION, Duration 45000ms"));
  assert(has("HIGH_RESOURCE_USAGE: Table T_A, Memory 3000MB, CPU 0.00%"));
  assert(has("ERROR_PATTERN: Table T_A, Error boom"));

  const auto empty = fixture.analyzer.Summarize("EXEC-NONE", kNow);
  assert(empty.active_resources == 0);
  assert(empty.average_optimization_score == 0.0);
  assert(empty.bottlenecks.empty());
}

void TestOptimizeThroughLifecycleManager() {
  auto repository = std::make_shared<staging::db::memory::MemoryRepository>();
  auto executor   = std::make_shared<MemorySqlExecutor>(SqlDialect::kOracle);
  auto metrics    = std::make_shared<staging::observability::InMemoryMetricsSink>();
  auto analyzer   = std::make_shared<PerformanceAnalyzer>(repository, executor);
  staging::core::LifecycleManager manager(repository, executor, metrics, analyzer);

  staging::core::CreationRequest request;
  request.execution_id        = "EXEC-OPT";
  request.transaction_type_id = 3;
  request.schema_json         = R"json({"columns": [{"name": "ACCOUNT_ID", "type": "VARCHAR2(100)"}]})json";
  const auto record           = manager.Create(request);

  const auto now = staging::util::Now();
  const auto add = [&](TimePoint at, double duration_ms) {
    PerformanceSampleRecord sample;
    sample.definition_id  = record.id;
    sample.execution_id   = record.execution_id;
    sample.kind           = SampleKind::kQueryExecution;
    sample.measured_at_ms = Ms(at);
    sample.duration_ms    = duration_ms;
    auto tx               = repository->Begin();
    assert(repository->SavePerformanceSample(*tx, sample));
    tx->Commit();
  };
  add(now - hours(5), 20'000.0);
  for (int i = 0; i < 3; ++i) {
    add(now - minutes(10 + i), 15'000.0);
  }

  const auto report = manager.Optimize(record.physical_name);
  assert(report.recommendations.size() == 1);
  assert(report.recommendations[0].type == RecommendationType::kIndexOptimization);
  assert(report.applied.size() == 1 && report.applied[0] == "INDEX_OPTIMIZATION");
  assert(report.improvement_percent > 0.0);
  assert(metrics->Counter(staging::observability::metric_names::kOptimizationsApplied) == 1);

  auto tx     = repository->Begin();
  auto latest = repository->FindLatestOptimization(*tx, record.id);
  tx->Commit();
  assert(latest.has_value());
  assert(Near(*latest->improvement_percent, report.improvement_percent));
}

} // namespace

int main() {
  TestRecommendationThresholds();
  TestAnalyzeWindowAndBottlenecks();
  TestErrorRateThresholdIsStrict();
  TestAnalyzeMissingDefinition();
  TestComputeImprovement();
  TestApplyRecordsTheOptimization();
  TestApplyFailuresWriteNothing();
  TestSummarizeExecution();
  TestOptimizeThroughLifecycleManager();

  std::cout << "staging_manager_unit_performance_analyzer: pass\n";
  return 0;
}
