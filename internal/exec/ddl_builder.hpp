#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/exec/sql_executor.hpp"
#include "internal/model/table_schema.hpp"
#include "internal/util/time.hpp"

namespace staging::exec {

/*
  Renders staging table statements for one SQL dialect.

  ORACLE is the reference form: VARCHAR2/NUMBER types, inline
  COMPRESS FOR OLTP, inline partition clauses and TDE encryption.
  POSTGRES translates types and expresses partitions as child tables.
  SQLITE supports the portable subset only.

  Directives a dialect cannot express come back as std::nullopt.
*/
class DdlBuilder {
 public:
  static constexpr int      kHashPartitions     = 8;
  static constexpr uint64_t kRangeNumberBoundary = 1'000'000;

  explicit DdlBuilder(SqlDialect dialect) : dialect_(dialect) {
  }

  SqlDialect Dialect() const {
    return dialect_;
  }

  // CREATE TABLE first, then any partition children. now anchors the
  // date range split for dialects that need a literal boundary.
  std::vector<std::string> CreateTable(const std::string& table, const model::TableSchema& schema, util::TimePoint now = util::Now()) const;

  std::optional<std::string> EncryptTable(const std::string& table) const;

  // Secondary indexes for the schema, in creation order.
  std::vector<std::string> CreateIndexes(const std::string& table, const model::TableSchema& schema) const;

  std::string DropTable(const std::string& table) const;

  std::optional<std::string> CompressTable(const std::string& table) const;

  std::optional<std::string> CacheTable(const std::string& table) const;

  // Composite index on status and creation time used by index optimization.
  std::string PerformanceIndex(const std::string& table) const;

  std::string ColumnType(const std::string& type) const;

 private:
  std::string ColumnList(const model::TableSchema& schema) const;
  std::string OraclePartitionClause(model::PartitionStrategy strategy) const;
  std::vector<std::string> PostgresPartitions(const std::string& table, model::PartitionStrategy strategy, util::TimePoint now) const;

  SqlDialect dialect_;
};

// Replaces every character outside [A-Za-z0-9] with '_'.
std::string SanitizeIdentifier(const std::string& text);

} // namespace staging::exec
