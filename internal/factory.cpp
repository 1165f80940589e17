#include "internal/factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/exec/memory_sql_executor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#if STAGING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/exec/sqlite_sql_executor.hpp"
#endif
#if STAGING_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/exec/pg_sql_executor.hpp"
#endif

namespace staging::factory {

namespace {

using staging::runtime::config::RuntimeConfig;
using observability::StringField;

template <typename T, typename U>
void Override(T& target, U value) {
  if (value != U{}) {
    target = static_cast<T>(value);
  }
}

exec::SqlDialect ToDialect(staging::runtime::config::SqlDialect dialect) {
  switch (dialect) {
    case staging::runtime::config::SQL_DIALECT_POSTGRES:
      return exec::SqlDialect::kPostgres;
    case staging::runtime::config::SQL_DIALECT_SQLITE:
      return exec::SqlDialect::kSqlite;
    case staging::runtime::config::SQL_DIALECT_ORACLE:
    default:
      return exec::SqlDialect::kOracle;
  }
}

// Connections opened while wiring, shared between the repository and the
// executor when both point at the same database.
struct Connections {
#if STAGING_DB_SQLITE
  std::shared_ptr<db::sqlite::SqliteDB> sqlite;
#endif
#if STAGING_DB_POSTGRES
  std::shared_ptr<db::postgres::PgPool> postgres;
  std::string                           postgres_uri;
#endif
};

#if STAGING_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->Exec(db::sql::CREATE_DEFINITIONS_SQLITE);
  sqlite_db->Exec(db::sql::CREATE_SAMPLES_SQLITE);

  sqlite_db->Exec("SELECT id,physical_name,dropped_at_ms FROM staging_definitions LIMIT 1;");
  sqlite_db->Exec("SELECT sample_id,definition_id,measured_at_ms FROM staging_performance_samples LIMIT 1;");
}
#endif

#if STAGING_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(db::sql::CREATE_DEFINITIONS_POSTGRES);
  tx.exec(db::sql::CREATE_SAMPLES_POSTGRES);

  tx.exec("SELECT id,physical_name,dropped_at_ms FROM staging_definitions LIMIT 1;");
  tx.exec("SELECT sample_id,definition_id,measured_at_ms FROM staging_performance_samples LIMIT 1;");
  tx.commit();
}

std::size_t PoolSize(const staging::runtime::config::PostgresConfig& config) {
  return config.max_connections() > 0 ? config.max_connections() : 8;
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config, Connections& connections) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STAGING_DB_SQLITE
    connections.sqlite = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(connections.sqlite);
    return std::make_shared<db::sqlite::SqliteRepository>(connections.sqlite);
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STAGING_DB_POSTGRES
    connections.postgres     = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), PoolSize(database.postgres()));
    connections.postgres_uri = database.postgres().connection_uri();
    BootstrapPostgresSchema(connections.postgres);
    return std::make_shared<db::postgres::PgRepository>(connections.postgres);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<exec::SqlExecutor> BuildExecutor(const RuntimeConfig& config, Connections& connections) {
  const auto& execution = config.execution();

  if (execution.has_sqlite()) {
#if STAGING_DB_SQLITE
    auto sqlite_db = connections.sqlite && connections.sqlite->Path() == execution.sqlite().path()
                         ? connections.sqlite
                         : std::make_shared<db::sqlite::SqliteDB>(execution.sqlite().path(), execution.sqlite().wal_mode());
    return std::make_shared<exec::SqliteSqlExecutor>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite execution engine requested but not enabled at build time");
#endif
  }

  if (execution.has_postgres()) {
#if STAGING_DB_POSTGRES
    auto pool = connections.postgres && connections.postgres_uri == execution.postgres().connection_uri()
                    ? connections.postgres
                    : std::make_shared<db::postgres::PgPool>(execution.postgres().connection_uri(), PoolSize(execution.postgres()));
    return std::make_shared<exec::PgSqlExecutor>(std::move(pool));
#else
    throw std::runtime_error("postgres execution engine requested but not enabled at build time");
#endif
  }

  STAGING_LOG_INFO("no execution engine configured, statements are recorded only",
                   {StringField("dialect", exec::ToString(ToDialect(execution.dialect())))});
  return std::make_shared<exec::MemorySqlExecutor>(ToDialect(execution.dialect()));
}

} // namespace

core::LifecyclePolicy LifecyclePolicyFromConfig(const RuntimeConfig& config) {
  const auto&           lifecycle = config.lifecycle();
  core::LifecyclePolicy policy;
  Override(policy.max_concurrent_creations, lifecycle.max_concurrent_creations());
  Override(policy.default_ttl_hours, lifecycle.default_ttl_hours());
  if (!lifecycle.table_prefix().empty()) {
    policy.table_prefix = lifecycle.table_prefix();
  }
  policy.encryption_mandatory = lifecycle.encryption_mandatory();
  return policy;
}

core::PartitionPolicy PartitionPolicyFromConfig(const RuntimeConfig& config) {
  const auto&           schema = config.schema_policy();
  core::PartitionPolicy policy;
  Override(policy.hash_min_records, schema.hash_partition_min_records());
  Override(policy.range_number_min_records, schema.range_number_partition_min_records());
  Override(policy.range_date_min_records, schema.range_date_partition_min_records());
  return policy;
}

core::SchemaPolicy SchemaPolicyFromConfig(const RuntimeConfig& config) {
  const auto&        schema = config.schema_policy();
  core::SchemaPolicy policy;
  Override(policy.compression_min_records, schema.compression_min_records());
  Override(policy.compression_min_ttl_hours, schema.compression_min_ttl_hours());
  Override(policy.selective_index_min_records, schema.selective_index_min_records());
  Override(policy.shrink_text_min_records, schema.shrink_text_min_records());
  policy.encryption_enabled = config.lifecycle().encryption_enabled();
  return policy;
}

perf::AnalyzerPolicy AnalyzerPolicyFromConfig(const RuntimeConfig& config) {
  const auto&          analyzer = config.analyzer();
  perf::AnalyzerPolicy policy;
  Override(policy.analysis_window_hours, analyzer.analysis_window_hours());
  Override(policy.slow_query_threshold_ms, analyzer.slow_query_threshold_ms());
  Override(policy.high_memory_threshold_mb, analyzer.high_memory_threshold_mb());
  Override(policy.error_rate_threshold, analyzer.error_rate_threshold());
  Override(policy.memory_ceiling_mb, analyzer.memory_ceiling_mb());
  Override(policy.io_ceiling_mb, analyzer.io_ceiling_mb());
  Override(policy.index_recommend_min_duration_ms, analyzer.index_recommend_min_duration_ms());
  Override(policy.partition_recommend_min_records, analyzer.partition_recommend_min_records());
  Override(policy.compression_recommend_min_size_mb, analyzer.compression_recommend_min_size_mb());
  Override(policy.compression_recommend_max_io_percent, analyzer.compression_recommend_max_io_percent());
  Override(policy.memory_recommend_min_percent, analyzer.memory_recommend_min_percent());
  Override(policy.archival_recommend_min_age_days, analyzer.archival_recommend_min_age_days());
  Override(policy.improvement_baseline_start_hours, analyzer.improvement_baseline_start_hours());
  Override(policy.improvement_baseline_end_hours, analyzer.improvement_baseline_end_hours());
  Override(policy.improvement_recent_hours, analyzer.improvement_recent_hours());
  Override(policy.summary_window_hours, analyzer.summary_window_hours());
  Override(policy.slow_operation_threshold_ms, analyzer.slow_operation_threshold_ms());
  return policy;
}

std::chrono::seconds CleanupIntervalFromConfig(const RuntimeConfig& config) {
  const auto seconds = config.cleanup().interval_seconds();
  return std::chrono::seconds(seconds > 0 ? seconds : 3600);
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<observability::MetricsSink> metrics) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  Connections connections;
  app.repository = BuildRepository(config, connections);
  app.executor   = BuildExecutor(config, connections);
  app.metrics    = metrics ? std::move(metrics) : std::make_shared<observability::Metrics>();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.analyzer = std::make_shared<perf::PerformanceAnalyzer>(app.repository, app.executor, AnalyzerPolicyFromConfig(config));
  app.manager  = std::make_shared<core::LifecycleManager>(app.repository, app.executor, app.metrics, app.analyzer,
                                                         LifecyclePolicyFromConfig(config), core::PartitionSelector(PartitionPolicyFromConfig(config)),
                                                         core::SchemaOptimizer(SchemaPolicyFromConfig(config)));
  app.manager->HydrateIndex();

  // ------------------------------------------------------------------
  // Cleanup
  // ------------------------------------------------------------------
  if (!config.cleanup().disabled()) {
    app.cleanup = std::make_shared<cleanup::CleanupScheduler>(app.manager, CleanupIntervalFromConfig(config));
  }

  return app;
}

} // namespace staging::factory
