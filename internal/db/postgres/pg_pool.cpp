#include "pg_pool.hpp"

namespace staging::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kDefinitionColumns =
      "id,execution_id,transaction_type_id,physical_name,table_schema,partition_strategy,ttl_hours,compression_level,"
      "encryption_applied,cleanup_policy,created_at_ms,dropped_at_ms,record_count,table_size_mb,last_access_at_ms,optimization_applied";
  static constexpr const char* kSampleColumns =
      "sample_id,definition_id,execution_id,kind,measured_at_ms,duration_ms,records_processed,memory_used_mb,cpu_percent,"
      "io_read_mb,io_write_mb,table_size_before_mb,table_size_after_mb,optimization_applied,improvement_percent,error_message,"
      "monitoring_source,note";

  const std::string definitions = kDefinitionColumns;
  const std::string samples     = kSampleColumns;

  conn.prepare("upsert_definition",
               "INSERT INTO staging_definitions(" + definitions +
                   ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)"
                   " ON CONFLICT(id) DO UPDATE SET"
                   " table_schema=EXCLUDED.table_schema,"
                   " partition_strategy=EXCLUDED.partition_strategy,"
                   " ttl_hours=EXCLUDED.ttl_hours,"
                   " compression_level=EXCLUDED.compression_level,"
                   " encryption_applied=EXCLUDED.encryption_applied,"
                   " cleanup_policy=EXCLUDED.cleanup_policy,"
                   " dropped_at_ms=COALESCE(staging_definitions.dropped_at_ms, EXCLUDED.dropped_at_ms),"
                   " record_count=EXCLUDED.record_count,"
                   " table_size_mb=EXCLUDED.table_size_mb,"
                   " last_access_at_ms=EXCLUDED.last_access_at_ms,"
                   " optimization_applied=EXCLUDED.optimization_applied");

  conn.prepare("definition_by_name", "SELECT " + definitions + " FROM staging_definitions WHERE physical_name=$1");

  conn.prepare("active_definitions",
               "SELECT " + definitions + " FROM staging_definitions WHERE dropped_at_ms IS NULL ORDER BY created_at_ms, physical_name");

  conn.prepare("active_definitions_by_execution", "SELECT " + definitions +
                                                      " FROM staging_definitions WHERE dropped_at_ms IS NULL AND execution_id=$1"
                                                      " ORDER BY created_at_ms, physical_name");

  conn.prepare("expired_definitions", "SELECT " + definitions +
                                          " FROM staging_definitions WHERE dropped_at_ms IS NULL AND ttl_hours > 0"
                                          " AND created_at_ms + ttl_hours * 3600000 <= $1"
                                          " AND cleanup_policy IN ('AUTO_DROP','ARCHIVE_THEN_DROP')"
                                          " ORDER BY created_at_ms, physical_name");

  conn.prepare("insert_sample",
               "INSERT INTO staging_performance_samples("
               "definition_id,execution_id,kind,measured_at_ms,duration_ms,records_processed,memory_used_mb,cpu_percent,"
               "io_read_mb,io_write_mb,table_size_before_mb,table_size_after_mb,optimization_applied,improvement_percent,error_message,"
               "monitoring_source,note) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17) RETURNING sample_id");

  conn.prepare("samples_since", "SELECT " + samples +
                                    " FROM staging_performance_samples WHERE definition_id=$1 AND measured_at_ms>=$2"
                                    " ORDER BY measured_at_ms DESC, sample_id DESC");

  conn.prepare("samples_in_range", "SELECT " + samples +
                                       " FROM staging_performance_samples WHERE definition_id=$1 AND measured_at_ms>=$2 AND measured_at_ms<=$3"
                                       " ORDER BY measured_at_ms DESC, sample_id DESC");

  conn.prepare("latest_optimization", "SELECT " + samples +
                                          " FROM staging_performance_samples WHERE definition_id=$1 AND kind='OPTIMIZATION_APPLIED'"
                                          " ORDER BY measured_at_ms DESC, sample_id DESC LIMIT 1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace staging::db::postgres
