#include "internal/core/lifecycle_manager.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cmath>
#include <stdexcept>

#include "internal/core/schema_codec.hpp"
#include "internal/exec/ddl_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/uuid.hpp"

namespace staging::core {

namespace {

namespace names = observability::metric_names;

using db::model::PerformanceSampleRecord;
using db::model::ResourceDefinitionRecord;
using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

constexpr const char* kCreationSource = "LIFECYCLE_MANAGER";
constexpr const char* kCleanupSource  = "CLEANUP_PROCESS";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::CreationError(message);
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

// Tracks one admitted creation; releases the slot on every exit path.
class AdmissionSlot {
 public:
  explicit AdmissionSlot(std::atomic<uint32_t>& in_flight) : in_flight_(in_flight) {
  }

  ~AdmissionSlot() {
    in_flight_.fetch_sub(1);
  }

  AdmissionSlot(const AdmissionSlot&)            = delete;
  AdmissionSlot& operator=(const AdmissionSlot&) = delete;

 private:
  std::atomic<uint32_t>& in_flight_;
};

ActiveResourceMetadata ToMetadata(const ResourceDefinitionRecord& record, std::shared_ptr<const model::TableSchema> schema) {
  ActiveResourceMetadata metadata;
  metadata.physical_name = record.physical_name;
  metadata.schema        = std::move(schema);
  metadata.partition     = record.partition_strategy;
  metadata.created_at    = util::FromUnixMillis(record.created_at_ms);
  metadata.definition_id = record.id;
  return metadata;
}

} // namespace

LifecycleManager::LifecycleManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<exec::SqlExecutor> executor,
                                   std::shared_ptr<observability::MetricsSink> metrics, std::shared_ptr<perf::PerformanceAnalyzer> analyzer,
                                   LifecyclePolicy policy, PartitionSelector selector, SchemaOptimizer optimizer)
    : repository_(std::move(repository)),
      executor_(std::move(executor)),
      metrics_(std::move(metrics)),
      analyzer_(std::move(analyzer)),
      policy_(std::move(policy)),
      selector_(selector),
      optimizer_(optimizer) {
  if (!repository_ || !executor_ || !metrics_ || !analyzer_) {
    throw std::invalid_argument("lifecycle manager requires repository, executor, metrics and analyzer");
  }
  if (policy_.max_concurrent_creations == 0) {
    throw std::invalid_argument("lifecycle manager requires max_concurrent_creations > 0");
  }
}

std::string LifecycleManager::PhysicalName(const std::string& execution_id, int64_t transaction_type_id, util::TimePoint now) {
  const auto seq = name_seq_.fetch_add(1) + 1;
  return exec::SanitizeIdentifier(
      util::ToUpper(fmt::format("{}_{}_{}_{}_{}", policy_.table_prefix, execution_id, transaction_type_id, util::ToUnixMillis(now), seq)));
}

void LifecycleManager::DropQuietly(const std::string& physical_name) {
  const exec::DdlBuilder ddl(executor_->Dialect());
  auto                   result = executor_->Execute(ddl.DropTable(physical_name));
  if (!result && result.code != db::ErrorCode::NotFound) {
    STAGING_LOG_WARN("failed to drop partially created staging table",
                     {StringField("table", physical_name), StringField("error", result.message)});
  }
}

void LifecycleManager::PublishActiveCount() {
  metrics_->SetGauge(names::kActiveResources, static_cast<int64_t>(index_.Size()));
}

ResourceDefinitionRecord LifecycleManager::Create(const CreationRequest& request) {
  observability::SpanScope span("staging.create");
  span.SetAttribute("staging.execution_id", request.execution_id);
  const auto started = std::chrono::steady_clock::now();

  if (in_flight_.fetch_add(1) >= policy_.max_concurrent_creations) {
    in_flight_.fetch_sub(1);
    span.RecordException("capacity");
    STAGING_LOG_WARN("staging table creation rejected, concurrency ceiling reached",
                     {StringField("execution_id", request.execution_id), IntField("ceiling", policy_.max_concurrent_creations)});
    throw util::CapacityError("maximum concurrent creations reached: " + std::to_string(policy_.max_concurrent_creations));
  }
  AdmissionSlot slot(in_flight_);

  try {
    if (util::IsBlank(request.execution_id)) {
      throw util::ValidationError("execution id is required");
    }
    if (!request.transaction_type_id.has_value()) {
      throw util::ValidationError("transaction type id is required");
    }
    if (util::IsBlank(request.schema_json)) {
      throw util::ValidationError("schema definition is required");
    }

    const auto parsed = optimizer_.Parse(request.schema_json);

    SchemaContext context;
    context.expected_records  = request.expected_records;
    context.security_required = request.security_required;
    context.ttl_hours         = request.ttl_hours > 0 ? request.ttl_hours : policy_.default_ttl_hours;
    context.partition = request.partition_override.value_or(selector_.Select(request.expected_records, parsed.columns));

    auto       schema = std::make_shared<const model::TableSchema>(optimizer_.Optimize(parsed, context));
    const auto now    = util::Now();
    const auto name   = PhysicalName(request.execution_id, *request.transaction_type_id, now);
    span.SetAttribute("staging.table", name);
    span.SetAttribute("staging.partition", model::ToString(schema->Partition()));

    const exec::DdlBuilder ddl(executor_->Dialect());

    const auto create_statements = ddl.CreateTable(name, *schema, now);
    for (std::size_t i = 0; i < create_statements.size(); ++i) {
      auto result = executor_->Execute(create_statements[i]);
      if (!result) {
        if (i > 0) {
          DropQuietly(name);
        }
        ThrowIfDbError(result, "create staging table " + name);
      }
    }

    bool encrypted = false;
    if (schema->Encryption()) {
      auto statement = ddl.EncryptTable(name);
      auto result    = statement.has_value() ? executor_->Execute(*statement)
                                             : db::Result::Err(db::ErrorCode::Unsupported, "encryption not supported by dialect " +
                                                                                               std::string(exec::ToString(ddl.Dialect())));
      if (result) {
        encrypted = true;
      } else if (policy_.encryption_mandatory) {
        DropQuietly(name);
        ThrowIfDbError(result, "encrypt staging table " + name);
      } else {
        STAGING_LOG_WARN("encryption not applied, continuing without it",
                         {StringField("table", name), StringField("statement", statement.value_or("")), StringField("error", result.message)});
      }
    }

    int64_t indexes = 0;
    for (const auto& statement : ddl.CreateIndexes(name, *schema)) {
      auto result = executor_->Execute(statement);
      if (!result) {
        STAGING_LOG_WARN("index creation failed, continuing",
                         {StringField("table", name), StringField("statement", statement), StringField("error", result.message)});
        continue;
      }
      ++indexes;
    }

    ResourceDefinitionRecord record;
    record.id                  = util::NewIdentity();
    record.execution_id        = request.execution_id;
    record.transaction_type_id = *request.transaction_type_id;
    record.physical_name       = name;
    record.table_schema        = EncodeSchema(*schema);
    record.partition_strategy  = schema->Partition();
    record.ttl_hours           = context.ttl_hours;
    record.compression_level   = schema->Compression() ? model::CompressionLevel::kAdvanced : model::CompressionLevel::kNone;
    record.encryption_applied  = encrypted;
    record.cleanup_policy      = request.cleanup_policy;
    record.created_at_ms       = util::ToUnixMillis(now);
    record.last_access_at_ms   = record.created_at_ms;

    const auto duration_ms = ElapsedMs(started);

    PerformanceSampleRecord sample;
    sample.definition_id     = record.id;
    sample.execution_id      = record.execution_id;
    sample.kind              = model::SampleKind::kTableCreation;
    sample.measured_at_ms    = util::ToUnixMillis(util::Now());
    sample.duration_ms       = duration_ms;
    sample.monitoring_source = kCreationSource;

    try {
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->SaveDefinition(*tx, record), "persist staging definition " + name);
      ThrowIfDbError(repository_->SavePerformanceSample(*tx, sample), "persist creation sample " + name);
      tx->Commit();
    } catch (const std::exception&) {
      DropQuietly(name);
      throw;
    }

    index_.Insert(ToMetadata(record, schema));
    metrics_->IncrementCounter(names::kResourcesCreated, 1);
    metrics_->RecordDurationMs(names::kCreateDurationMs, duration_ms);
    PublishActiveCount();

    STAGING_LOG_INFO("staging table created",
                     {StringField("table", name), StringField("execution_id", record.execution_id),
                      StringField("partition", model::ToString(record.partition_strategy)), BoolField("compressed", schema->Compression()),
                      BoolField("encrypted", encrypted), IntField("indexes", indexes), DoubleField("duration_ms", duration_ms)});
    return record;
  } catch (const util::ValidationError& e) {
    span.RecordException(e.what());
    STAGING_LOG_ERROR("staging table request rejected", {StringField("execution_id", request.execution_id), StringField("error", e.what())});
    throw;
  } catch (const util::CreationError& e) {
    span.RecordException(e.what());
    STAGING_LOG_ERROR("staging table creation failed", {StringField("execution_id", request.execution_id), StringField("error", e.what())});
    throw;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    STAGING_LOG_ERROR("staging table creation failed", {StringField("execution_id", request.execution_id), StringField("error", e.what())});
    throw util::CreationError(std::string("staging table creation failed: ") + e.what());
  }
}

bool LifecycleManager::Retire(const std::string& physical_name, const std::string& reason) {
  observability::SpanScope span("staging.retire");
  span.SetAttribute("staging.table", physical_name);
  span.SetAttribute("staging.reason", reason);
  const auto started = std::chrono::steady_clock::now();

  {
    std::lock_guard<std::mutex> lock(retiring_mutex_);
    if (!retiring_.insert(physical_name).second) {
      STAGING_LOG_INFO("retirement already in progress", {StringField("table", physical_name)});
      return false;
    }
  }
  struct RetiringGuard {
    LifecycleManager* self;
    std::string       name;
    ~RetiringGuard() {
      std::lock_guard<std::mutex> lock(self->retiring_mutex_);
      self->retiring_.erase(name);
    }
  } guard{this, physical_name};

  try {
    std::optional<ResourceDefinitionRecord> definition;
    {
      auto tx    = repository_->Begin();
      definition = repository_->FindDefinitionByName(*tx, physical_name);
      tx->Commit();
    }

    if (!definition.has_value()) {
      STAGING_LOG_WARN("retire skipped, no definition for staging table", {StringField("table", physical_name)});
      index_.Erase(physical_name);
      return false;
    }
    if (!definition->IsActive()) {
      STAGING_LOG_INFO("staging table already retired", {StringField("table", physical_name)});
      if (index_.Erase(physical_name)) {
        PublishActiveCount();
      }
      return false;
    }

    const exec::DdlBuilder ddl(executor_->Dialect());
    const auto             drop   = ddl.DropTable(physical_name);
    auto                   result = executor_->Execute(drop);
    if (!result) {
      if (result.code != db::ErrorCode::NotFound) {
        STAGING_LOG_ERROR("drop failed, staging table left active",
                          {StringField("table", physical_name), StringField("statement", drop), StringField("error", result.message)});
        span.RecordException(result.message);
        return false;
      }
      STAGING_LOG_WARN("staging table already absent", {StringField("table", physical_name), StringField("error", result.message)});
    }

    definition->dropped_at_ms = util::ToUnixMillis(util::Now());
    {
      auto tx = repository_->Begin();
      if (auto r = repository_->SaveDefinition(*tx, *definition); !r) {
        STAGING_LOG_ERROR("dropped timestamp not persisted",
                          {StringField("table", physical_name), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
        span.RecordException(r.message);
        return false;
      }
      tx->Commit();
    }

    PerformanceSampleRecord archive;
    archive.definition_id        = definition->id;
    archive.execution_id         = definition->execution_id;
    archive.kind                 = model::SampleKind::kCleanupExecution;
    archive.measured_at_ms       = *definition->dropped_at_ms;
    archive.records_processed    = definition->record_count;
    archive.table_size_before_mb = definition->table_size_mb;
    archive.table_size_after_mb  = 0.0;
    archive.monitoring_source    = kCleanupSource;
    archive.note                 = reason;
    {
      auto tx = repository_->Begin();
      if (auto r = repository_->SavePerformanceSample(*tx, archive); !r) {
        STAGING_LOG_WARN("cleanup sample not archived", {StringField("table", physical_name), StringField("error", r.message)});
      } else {
        tx->Commit();
      }
    }

    index_.Erase(physical_name);
    const auto duration_ms = ElapsedMs(started);
    metrics_->IncrementCounter(names::kResourcesDropped, 1);
    metrics_->RecordDurationMs(names::kDropDurationMs, duration_ms);
    PublishActiveCount();

    STAGING_LOG_INFO("staging table retired",
                     {StringField("table", physical_name), StringField("reason", reason), DoubleField("duration_ms", duration_ms)});
    return true;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    STAGING_LOG_ERROR("staging table retirement failed", {StringField("table", physical_name), StringField("error", e.what())});
    return false;
  }
}

perf::OptimizationReport LifecycleManager::Optimize(const std::string& physical_name) {
  observability::SpanScope span("staging.optimize");
  span.SetAttribute("staging.table", physical_name);
  const auto started = std::chrono::steady_clock::now();
  const auto now     = util::Now();

  perf::OptimizationReport report;
  report.physical_name = physical_name;

  auto analysis = analyzer_->Analyze(physical_name, now);
  if (analysis.HasError()) {
    span.RecordException(*analysis.error);
    if (analysis.definition_missing) {
      throw util::NotFound("optimize: no staging definition for " + physical_name);
    }
    STAGING_LOG_WARN("optimization skipped, analysis failed", {StringField("table", physical_name), StringField("error", *analysis.error)});
    report.duration_ms = ElapsedMs(started);
    return report;
  }

  report.recommendations     = analyzer_->Recommend(analysis);
  report.improvement_percent = analyzer_->ComputeImprovement(analysis.definition_id, now);

  for (const auto& recommendation : report.recommendations) {
    if (analyzer_->Apply(physical_name, recommendation, report.improvement_percent, now)) {
      report.applied.emplace_back(model::ToString(recommendation.type));
    }
  }

  report.duration_ms = ElapsedMs(started);
  if (!report.applied.empty()) {
    metrics_->IncrementCounter(names::kOptimizationsApplied, report.applied.size());
  }
  metrics_->RecordDurationMs(names::kOptimizeDurationMs, report.duration_ms);
  span.SetAttribute("staging.optimizations_applied", static_cast<int64_t>(report.applied.size()));

  STAGING_LOG_INFO("staging table optimized",
                   {StringField("table", physical_name), IntField("recommended", static_cast<int64_t>(report.recommendations.size())),
                    IntField("applied", static_cast<int64_t>(report.applied.size())),
                    DoubleField("improvement_percent", report.improvement_percent), DoubleField("duration_ms", report.duration_ms)});
  return report;
}

perf::AnalysisResult LifecycleManager::Analyze(const std::string& physical_name) const {
  return analyzer_->Analyze(physical_name);
}

perf::ExecutionSummary LifecycleManager::GetMetrics(const std::string& execution_id) {
  auto summary = analyzer_->Summarize(execution_id);
  metrics_->SetGauge(names::kActiveMemoryMb, std::llround(summary.total_memory_mb));
  return summary;
}

std::size_t LifecycleManager::HydrateIndex() {
  try {
    auto tx      = repository_->Begin();
    auto records = repository_->FindActiveDefinitions(*tx);
    tx->Commit();

    std::vector<ActiveResourceMetadata> entries;
    entries.reserve(records.size());
    for (const auto& record : records) {
      // decoded lazily by ResolveSchema
      entries.push_back(ToMetadata(record, nullptr));
    }
    index_.Replace(std::move(entries));
    PublishActiveCount();

    STAGING_LOG_INFO("active staging index rebuilt", {IntField("active", static_cast<int64_t>(index_.Size()))});
    return index_.Size();
  } catch (const std::exception& e) {
    STAGING_LOG_ERROR("active staging index rebuild failed, starting empty", {StringField("error", e.what())});
    index_.Replace({});
    PublishActiveCount();
    return 0;
  }
}

std::vector<ResourceDefinitionRecord> LifecycleManager::FindExpired(util::TimePoint now) const {
  auto tx      = repository_->Begin();
  auto expired = repository_->FindExpiredDefinitions(*tx, util::ToUnixMillis(now));
  tx->Commit();
  return expired;
}

std::vector<ResourceDefinitionRecord> LifecycleManager::ListActive() const {
  auto tx     = repository_->Begin();
  auto active = repository_->FindActiveDefinitions(*tx);
  tx->Commit();
  return active;
}

std::shared_ptr<const model::TableSchema> LifecycleManager::ResolveSchema(const std::string& physical_name) {
  auto entry = index_.Find(physical_name);
  if (!entry.has_value()) {
    throw util::NotFound("no active staging table " + physical_name);
  }
  if (entry->schema) {
    return entry->schema;
  }

  std::optional<ResourceDefinitionRecord> definition;
  {
    auto tx    = repository_->Begin();
    definition = repository_->FindDefinitionByName(*tx, physical_name);
    tx->Commit();
  }
  if (!definition.has_value()) {
    throw util::NotFound("no staging definition for " + physical_name);
  }

  auto schema = std::make_shared<const model::TableSchema>(DecodeSchema(definition->table_schema));
  index_.SetSchema(physical_name, schema);
  return schema;
}

} // namespace staging::core
