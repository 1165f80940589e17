#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <optional>
#include <stdexcept>
#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"

namespace staging::db::sqlite {

using staging::db::ErrorCode;
using staging::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

template <typename T>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (!v) {
    sqlite3_bind_null(st, idx);
    return;
  }
  if constexpr (std::is_same_v<T, std::string>) {
    BindText(st, idx, *v);
  } else if constexpr (std::is_floating_point_v<T>) {
    BindDouble(st, idx, *v);
  } else {
    BindU64(st, idx, *v);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

model::ResourceDefinitionRecord ReadDefinition(sqlite3_stmt* st) {
  using namespace staging::model;

  model::ResourceDefinitionRecord r;
  r.id                  = ColText(st, 0);
  r.execution_id        = ColText(st, 1);
  r.transaction_type_id = sqlite3_column_int64(st, 2);
  r.physical_name       = ColText(st, 3);
  r.table_schema        = ColText(st, 4);
  r.partition_strategy  = PartitionStrategyFromString(ColText(st, 5)).value_or(PartitionStrategy::kNone);
  r.ttl_hours           = static_cast<uint32_t>(sqlite3_column_int64(st, 6));
  r.compression_level   = CompressionLevelFromString(ColText(st, 7)).value_or(CompressionLevel::kNone);
  r.encryption_applied  = sqlite3_column_int(st, 8) != 0;
  r.cleanup_policy      = CleanupPolicyFromString(ColText(st, 9)).value_or(CleanupPolicy::kManual);
  r.created_at_ms       = ColU64(st, 10);
  if (!ColIsNull(st, 11)) r.dropped_at_ms = ColU64(st, 11);
  r.record_count         = ColU64(st, 12);
  r.table_size_mb        = sqlite3_column_double(st, 13);
  r.last_access_at_ms    = ColU64(st, 14);
  r.optimization_applied = ColText(st, 15);
  return r;
}

model::PerformanceSampleRecord ReadSample(sqlite3_stmt* st) {
  using namespace staging::model;

  model::PerformanceSampleRecord s;
  s.sample_id      = ColU64(st, 0);
  s.definition_id  = ColText(st, 1);
  s.execution_id   = ColText(st, 2);
  s.kind           = SampleKindFromString(ColText(st, 3)).value_or(SampleKind::kQueryExecution);
  s.measured_at_ms = ColU64(st, 4);
  if (!ColIsNull(st, 5)) s.duration_ms = sqlite3_column_double(st, 5);
  s.records_processed    = ColU64(st, 6);
  s.memory_used_mb       = sqlite3_column_double(st, 7);
  s.cpu_percent          = sqlite3_column_double(st, 8);
  s.io_read_mb           = sqlite3_column_double(st, 9);
  s.io_write_mb          = sqlite3_column_double(st, 10);
  s.table_size_before_mb = sqlite3_column_double(st, 11);
  s.table_size_after_mb  = sqlite3_column_double(st, 12);
  s.optimization_applied = ColText(st, 13);
  if (!ColIsNull(st, 14)) s.improvement_percent = sqlite3_column_double(st, 14);
  if (!ColIsNull(st, 15)) s.error_message = ColText(st, 15);
  s.monitoring_source = ColText(st, 16);
  s.note              = ColText(st, 17);
  return s;
}

template <typename Row, typename Reader>
std::vector<Row> ReadAll(sqlite3* db, sqlite3_stmt* st, Reader reader) {
  std::vector<Row> rows;
  for (;;) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) {
      throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    rows.push_back(reader(st));
  }
  return rows;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Definitions
// ------------------------------------------------------------------

Result SqliteRepository::SaveDefinition(Transaction& t, const model::ResourceDefinitionRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPSERT_DEFINITION, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindText(raw, 1, r.id);
  BindText(raw, 2, r.execution_id);
  BindI64(raw, 3, r.transaction_type_id);
  BindText(raw, 4, r.physical_name);
  BindText(raw, 5, r.table_schema);
  BindText(raw, 6, std::string(staging::model::ToString(r.partition_strategy)));
  BindU64(raw, 7, r.ttl_hours);
  BindText(raw, 8, std::string(staging::model::ToString(r.compression_level)));
  sqlite3_bind_int(raw, 9, r.encryption_applied ? 1 : 0);
  BindText(raw, 10, std::string(staging::model::ToString(r.cleanup_policy)));
  BindU64(raw, 11, r.created_at_ms);
  BindOptional(raw, 12, r.dropped_at_ms);
  BindU64(raw, 13, r.record_count);
  BindDouble(raw, 14, r.table_size_mb);
  BindU64(raw, 15, r.last_access_at_ms);
  BindText(raw, 16, r.optimization_applied);

  int rc = sqlite3_step(raw);
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  }
  return Translate(db, rc);
}

std::optional<model::ResourceDefinitionRecord> SqliteRepository::FindDefinitionByName(Transaction& t, const std::string& physical_name) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_DEFINITION_BY_NAME);
  BindText(st.get(), 1, physical_name);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ReadDefinition(st.get());
}

std::vector<model::ResourceDefinitionRecord> SqliteRepository::FindActiveDefinitions(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_ACTIVE_DEFINITIONS);
  return ReadAll<model::ResourceDefinitionRecord>(db, st.get(), ReadDefinition);
}

std::vector<model::ResourceDefinitionRecord> SqliteRepository::FindActiveDefinitionsByExecution(Transaction& t, const std::string& execution_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_ACTIVE_DEFINITIONS_BY_EXECUTION);
  BindText(st.get(), 1, execution_id);
  return ReadAll<model::ResourceDefinitionRecord>(db, st.get(), ReadDefinition);
}

std::vector<model::ResourceDefinitionRecord> SqliteRepository::FindExpiredDefinitions(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_EXPIRED_DEFINITIONS);
  BindU64(st.get(), 1, now_ms);
  return ReadAll<model::ResourceDefinitionRecord>(db, st.get(), ReadDefinition);
}

// ------------------------------------------------------------------
// Samples
// ------------------------------------------------------------------

Result SqliteRepository::SavePerformanceSample(Transaction& t, model::PerformanceSampleRecord& s) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_SAMPLE, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindText(raw, 1, s.definition_id);
  BindText(raw, 2, s.execution_id);
  BindText(raw, 3, std::string(staging::model::ToString(s.kind)));
  BindU64(raw, 4, s.measured_at_ms);
  BindOptional(raw, 5, s.duration_ms);
  BindU64(raw, 6, s.records_processed);
  BindDouble(raw, 7, s.memory_used_mb);
  BindDouble(raw, 8, s.cpu_percent);
  BindDouble(raw, 9, s.io_read_mb);
  BindDouble(raw, 10, s.io_write_mb);
  BindDouble(raw, 11, s.table_size_before_mb);
  BindDouble(raw, 12, s.table_size_after_mb);
  BindText(raw, 13, s.optimization_applied);
  BindOptional(raw, 14, s.improvement_percent);
  BindOptional(raw, 15, s.error_message);
  BindText(raw, 16, s.monitoring_source);
  BindText(raw, 17, s.note);

  int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE) {
    s.sample_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Translate(db, rc);
}

std::vector<model::PerformanceSampleRecord> SqliteRepository::FindRecentSamples(Transaction& t, const std::string& definition_id, uint64_t since_ms) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_SAMPLES_SINCE);
  BindText(st.get(), 1, definition_id);
  BindU64(st.get(), 2, since_ms);
  return ReadAll<model::PerformanceSampleRecord>(db, st.get(), ReadSample);
}

std::vector<model::PerformanceSampleRecord> SqliteRepository::FindSamplesInRange(Transaction& t, const std::string& definition_id, uint64_t start_ms,
                                                                                 uint64_t end_ms) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_SAMPLES_IN_RANGE);
  BindText(st.get(), 1, definition_id);
  BindU64(st.get(), 2, start_ms);
  BindU64(st.get(), 3, end_ms);
  return ReadAll<model::PerformanceSampleRecord>(db, st.get(), ReadSample);
}

std::optional<model::PerformanceSampleRecord> SqliteRepository::FindLatestOptimization(Transaction& t, const std::string& definition_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_LATEST_OPTIMIZATION);
  BindText(st.get(), 1, definition_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ReadSample(st.get());
}

} // namespace staging::db::sqlite
