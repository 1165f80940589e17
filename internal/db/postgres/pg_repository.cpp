#include "pg_repository.hpp"

namespace staging::db::postgres {

namespace {

model::ResourceDefinitionRecord ReadDefinition(const pqxx::row& row) {
  using namespace staging::model;

  model::ResourceDefinitionRecord r;
  r.id                  = row[0].c_str();
  r.execution_id        = row[1].c_str();
  r.transaction_type_id = row[2].as<int64_t>();
  r.physical_name       = row[3].c_str();
  r.table_schema        = row[4].c_str();
  r.partition_strategy  = PartitionStrategyFromString(row[5].c_str()).value_or(PartitionStrategy::kNone);
  r.ttl_hours           = row[6].as<uint32_t>();
  r.compression_level   = CompressionLevelFromString(row[7].c_str()).value_or(CompressionLevel::kNone);
  r.encryption_applied  = row[8].as<bool>();
  r.cleanup_policy      = CleanupPolicyFromString(row[9].c_str()).value_or(CleanupPolicy::kManual);
  r.created_at_ms       = row[10].as<uint64_t>();
  if (!row[11].is_null()) r.dropped_at_ms = row[11].as<uint64_t>();
  r.record_count         = row[12].as<uint64_t>();
  r.table_size_mb        = row[13].as<double>();
  r.last_access_at_ms    = row[14].as<uint64_t>();
  r.optimization_applied = row[15].c_str();
  return r;
}

model::PerformanceSampleRecord ReadSample(const pqxx::row& row) {
  using namespace staging::model;

  model::PerformanceSampleRecord s;
  s.sample_id      = row[0].as<uint64_t>();
  s.definition_id  = row[1].c_str();
  s.execution_id   = row[2].c_str();
  s.kind           = SampleKindFromString(row[3].c_str()).value_or(SampleKind::kQueryExecution);
  s.measured_at_ms = row[4].as<uint64_t>();
  if (!row[5].is_null()) s.duration_ms = row[5].as<double>();
  s.records_processed    = row[6].as<uint64_t>();
  s.memory_used_mb       = row[7].as<double>();
  s.cpu_percent          = row[8].as<double>();
  s.io_read_mb           = row[9].as<double>();
  s.io_write_mb          = row[10].as<double>();
  s.table_size_before_mb = row[11].as<double>();
  s.table_size_after_mb  = row[12].as<double>();
  s.optimization_applied = row[13].c_str();
  if (!row[14].is_null()) s.improvement_percent = row[14].as<double>();
  if (!row[15].is_null()) s.error_message = std::string(row[15].c_str());
  s.monitoring_source = row[16].c_str();
  s.note              = row[17].c_str();
  return s;
}

std::vector<model::ResourceDefinitionRecord> ReadDefinitions(const pqxx::result& res) {
  std::vector<model::ResourceDefinitionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadDefinition(row));
  }
  return out;
}

std::vector<model::PerformanceSampleRecord> ReadSamples(const pqxx::result& res) {
  std::vector<model::PerformanceSampleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSample(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::SaveDefinition(Transaction& t, const model::ResourceDefinitionRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_definition", r.id, r.execution_id, r.transaction_type_id, r.physical_name, r.table_schema,
                               std::string(staging::model::ToString(r.partition_strategy)), static_cast<int64_t>(r.ttl_hours),
                               std::string(staging::model::ToString(r.compression_level)), r.encryption_applied,
                               std::string(staging::model::ToString(r.cleanup_policy)), r.created_at_ms, r.dropped_at_ms, r.record_count,
                               r.table_size_mb, r.last_access_at_ms, r.optimization_applied);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ResourceDefinitionRecord> PgRepository::FindDefinitionByName(Transaction& t, const std::string& physical_name) {
  auto res = TX(t).Work().exec_prepared("definition_by_name", physical_name);
  if (res.empty()) return std::nullopt;
  return ReadDefinition(res[0]);
}

std::vector<model::ResourceDefinitionRecord> PgRepository::FindActiveDefinitions(Transaction& t) {
  return ReadDefinitions(TX(t).Work().exec_prepared("active_definitions"));
}

std::vector<model::ResourceDefinitionRecord> PgRepository::FindActiveDefinitionsByExecution(Transaction& t, const std::string& execution_id) {
  return ReadDefinitions(TX(t).Work().exec_prepared("active_definitions_by_execution", execution_id));
}

std::vector<model::ResourceDefinitionRecord> PgRepository::FindExpiredDefinitions(Transaction& t, uint64_t now_ms) {
  return ReadDefinitions(TX(t).Work().exec_prepared("expired_definitions", now_ms));
}

Result PgRepository::SavePerformanceSample(Transaction& t, model::PerformanceSampleRecord& s) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_sample", s.definition_id, s.execution_id, std::string(staging::model::ToString(s.kind)),
                                          s.measured_at_ms, s.duration_ms, s.records_processed, s.memory_used_mb, s.cpu_percent, s.io_read_mb,
                                          s.io_write_mb, s.table_size_before_mb, s.table_size_after_mb, s.optimization_applied,
                                          s.improvement_percent, s.error_message, s.monitoring_source, s.note);
    if (!res.empty()) {
      s.sample_id = res[0][0].as<uint64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PerformanceSampleRecord> PgRepository::FindRecentSamples(Transaction& t, const std::string& definition_id, uint64_t since_ms) {
  return ReadSamples(TX(t).Work().exec_prepared("samples_since", definition_id, since_ms));
}

std::vector<model::PerformanceSampleRecord> PgRepository::FindSamplesInRange(Transaction& t, const std::string& definition_id, uint64_t start_ms,
                                                                             uint64_t end_ms) {
  return ReadSamples(TX(t).Work().exec_prepared("samples_in_range", definition_id, start_ms, end_ms));
}

std::optional<model::PerformanceSampleRecord> PgRepository::FindLatestOptimization(Transaction& t, const std::string& definition_id) {
  auto res = TX(t).Work().exec_prepared("latest_optimization", definition_id);
  if (res.empty()) return std::nullopt;
  return ReadSample(res[0]);
}

} // namespace staging::db::postgres
