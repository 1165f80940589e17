#pragma once

namespace staging::db::sql {

/*
  Canonical SQL shared by the SQL backends.

  Written in the SQLite dialect with '?' placeholders; the Postgres
  backend prepares the same statements with '$n' placeholders in
  PgPool::PrepareStatements. Column order here is the order the row
  readers expect.
*/

// ---------------------------------------------------------------------
// Bootstrap
// ---------------------------------------------------------------------

static constexpr const char* CREATE_DEFINITIONS_SQLITE =
    "CREATE TABLE IF NOT EXISTS staging_definitions ("
    " id TEXT PRIMARY KEY,"
    " execution_id TEXT NOT NULL,"
    " transaction_type_id INTEGER NOT NULL,"
    " physical_name TEXT NOT NULL UNIQUE,"
    " table_schema TEXT NOT NULL,"
    " partition_strategy TEXT NOT NULL,"
    " ttl_hours INTEGER NOT NULL,"
    " compression_level TEXT NOT NULL,"
    " encryption_applied INTEGER NOT NULL,"
    " cleanup_policy TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " dropped_at_ms INTEGER,"
    " record_count INTEGER NOT NULL DEFAULT 0,"
    " table_size_mb REAL NOT NULL DEFAULT 0,"
    " last_access_at_ms INTEGER NOT NULL DEFAULT 0,"
    " optimization_applied TEXT NOT NULL DEFAULT ''"
    ");"
    "CREATE INDEX IF NOT EXISTS staging_definitions_active_idx ON staging_definitions(dropped_at_ms, created_at_ms);"
    "CREATE INDEX IF NOT EXISTS staging_definitions_execution_idx ON staging_definitions(execution_id);";

static constexpr const char* CREATE_SAMPLES_SQLITE =
    "CREATE TABLE IF NOT EXISTS staging_performance_samples ("
    " sample_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " definition_id TEXT NOT NULL REFERENCES staging_definitions(id),"
    " execution_id TEXT NOT NULL,"
    " kind TEXT NOT NULL,"
    " measured_at_ms INTEGER NOT NULL,"
    " duration_ms REAL,"
    " records_processed INTEGER NOT NULL DEFAULT 0,"
    " memory_used_mb REAL NOT NULL DEFAULT 0,"
    " cpu_percent REAL NOT NULL DEFAULT 0,"
    " io_read_mb REAL NOT NULL DEFAULT 0,"
    " io_write_mb REAL NOT NULL DEFAULT 0,"
    " table_size_before_mb REAL NOT NULL DEFAULT 0,"
    " table_size_after_mb REAL NOT NULL DEFAULT 0,"
    " optimization_applied TEXT NOT NULL DEFAULT '',"
    " improvement_percent REAL,"
    " error_message TEXT,"
    " monitoring_source TEXT NOT NULL DEFAULT '',"
    " note TEXT NOT NULL DEFAULT ''"
    ");"
    "CREATE INDEX IF NOT EXISTS staging_samples_definition_idx ON staging_performance_samples(definition_id, measured_at_ms);";

static constexpr const char* CREATE_DEFINITIONS_POSTGRES =
    "CREATE TABLE IF NOT EXISTS staging_definitions ("
    " id TEXT PRIMARY KEY,"
    " execution_id TEXT NOT NULL,"
    " transaction_type_id BIGINT NOT NULL,"
    " physical_name TEXT NOT NULL UNIQUE,"
    " table_schema TEXT NOT NULL,"
    " partition_strategy TEXT NOT NULL,"
    " ttl_hours BIGINT NOT NULL,"
    " compression_level TEXT NOT NULL,"
    " encryption_applied BOOLEAN NOT NULL,"
    " cleanup_policy TEXT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " dropped_at_ms BIGINT,"
    " record_count BIGINT NOT NULL DEFAULT 0,"
    " table_size_mb DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " last_access_at_ms BIGINT NOT NULL DEFAULT 0,"
    " optimization_applied TEXT NOT NULL DEFAULT ''"
    ");"
    "CREATE INDEX IF NOT EXISTS staging_definitions_active_idx ON staging_definitions(dropped_at_ms, created_at_ms);"
    "CREATE INDEX IF NOT EXISTS staging_definitions_execution_idx ON staging_definitions(execution_id);";

static constexpr const char* CREATE_SAMPLES_POSTGRES =
    "CREATE TABLE IF NOT EXISTS staging_performance_samples ("
    " sample_id BIGSERIAL PRIMARY KEY,"
    " definition_id TEXT NOT NULL REFERENCES staging_definitions(id),"
    " execution_id TEXT NOT NULL,"
    " kind TEXT NOT NULL,"
    " measured_at_ms BIGINT NOT NULL,"
    " duration_ms DOUBLE PRECISION,"
    " records_processed BIGINT NOT NULL DEFAULT 0,"
    " memory_used_mb DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " cpu_percent DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " io_read_mb DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " io_write_mb DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " table_size_before_mb DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " table_size_after_mb DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " optimization_applied TEXT NOT NULL DEFAULT '',"
    " improvement_percent DOUBLE PRECISION,"
    " error_message TEXT,"
    " monitoring_source TEXT NOT NULL DEFAULT '',"
    " note TEXT NOT NULL DEFAULT ''"
    ");"
    "CREATE INDEX IF NOT EXISTS staging_samples_definition_idx ON staging_performance_samples(definition_id, measured_at_ms);";

// ---------------------------------------------------------------------
// Definitions
// ---------------------------------------------------------------------

#define STAGING_DEFINITION_COLUMNS                                                                                                   \
  "id,execution_id,transaction_type_id,physical_name,table_schema,partition_strategy,ttl_hours,compression_level,"                  \
  "encryption_applied,cleanup_policy,created_at_ms,dropped_at_ms,record_count,table_size_mb,last_access_at_ms,optimization_applied"

static constexpr const char* UPSERT_DEFINITION =
    "INSERT INTO staging_definitions(" STAGING_DEFINITION_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " table_schema=excluded.table_schema,"
    " partition_strategy=excluded.partition_strategy,"
    " ttl_hours=excluded.ttl_hours,"
    " compression_level=excluded.compression_level,"
    " encryption_applied=excluded.encryption_applied,"
    " cleanup_policy=excluded.cleanup_policy,"
    " dropped_at_ms=COALESCE(staging_definitions.dropped_at_ms, excluded.dropped_at_ms),"
    " record_count=excluded.record_count,"
    " table_size_mb=excluded.table_size_mb,"
    " last_access_at_ms=excluded.last_access_at_ms,"
    " optimization_applied=excluded.optimization_applied;";

static constexpr const char* SELECT_DEFINITION_BY_NAME =
    "SELECT " STAGING_DEFINITION_COLUMNS " FROM staging_definitions WHERE physical_name=?;";

static constexpr const char* SELECT_ACTIVE_DEFINITIONS =
    "SELECT " STAGING_DEFINITION_COLUMNS " FROM staging_definitions"
    " WHERE dropped_at_ms IS NULL ORDER BY created_at_ms, physical_name;";

static constexpr const char* SELECT_ACTIVE_DEFINITIONS_BY_EXECUTION =
    "SELECT " STAGING_DEFINITION_COLUMNS " FROM staging_definitions"
    " WHERE dropped_at_ms IS NULL AND execution_id=? ORDER BY created_at_ms, physical_name;";

static constexpr const char* SELECT_EXPIRED_DEFINITIONS =
    "SELECT " STAGING_DEFINITION_COLUMNS " FROM staging_definitions"
    " WHERE dropped_at_ms IS NULL AND ttl_hours > 0"
    " AND created_at_ms + ttl_hours * 3600000 <= ?"
    " AND cleanup_policy IN ('AUTO_DROP','ARCHIVE_THEN_DROP')"
    " ORDER BY created_at_ms, physical_name;";

// ---------------------------------------------------------------------
// Performance samples
// ---------------------------------------------------------------------

#define STAGING_SAMPLE_COLUMNS                                                                                                       \
  "sample_id,definition_id,execution_id,kind,measured_at_ms,duration_ms,records_processed,memory_used_mb,cpu_percent,"              \
  "io_read_mb,io_write_mb,table_size_before_mb,table_size_after_mb,optimization_applied,improvement_percent,error_message,"           \
  "monitoring_source,note"

static constexpr const char* INSERT_SAMPLE =
    "INSERT INTO staging_performance_samples("
    "definition_id,execution_id,kind,measured_at_ms,duration_ms,records_processed,memory_used_mb,cpu_percent,"
    "io_read_mb,io_write_mb,table_size_before_mb,table_size_after_mb,optimization_applied,improvement_percent,error_message,"
    "monitoring_source,note)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SAMPLES_SINCE =
    "SELECT " STAGING_SAMPLE_COLUMNS " FROM staging_performance_samples"
    " WHERE definition_id=? AND measured_at_ms>=? ORDER BY measured_at_ms DESC, sample_id DESC;";

static constexpr const char* SELECT_SAMPLES_IN_RANGE =
    "SELECT " STAGING_SAMPLE_COLUMNS " FROM staging_performance_samples"
    " WHERE definition_id=? AND measured_at_ms>=? AND measured_at_ms<=? ORDER BY measured_at_ms DESC, sample_id DESC;";

static constexpr const char* SELECT_LATEST_OPTIMIZATION =
    "SELECT " STAGING_SAMPLE_COLUMNS " FROM staging_performance_samples"
    " WHERE definition_id=? AND kind='OPTIMIZATION_APPLIED' ORDER BY measured_at_ms DESC, sample_id DESC LIMIT 1;";

} // namespace staging::db::sql
