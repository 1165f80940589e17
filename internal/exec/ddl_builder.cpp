#include "internal/exec/ddl_builder.hpp"

#include <cctype>
#include <chrono>

#include "internal/util/strings.hpp"

namespace staging::exec {

namespace {

using model::PartitionStrategy;
using util::StartsWith;
using util::ToUpper;
namespace sys = model::system_columns;

bool IsIndexed(const model::TableSchema& schema, const char* column) {
  const auto* spec = schema.FindColumn(column);
  return spec != nullptr && spec->indexed;
}

std::string Index(const std::string& table, const std::string& suffix, const std::string& columns) {
  return "CREATE INDEX IDX_" + table + "_" + suffix + " ON " + table + " (" + columns + ")";
}

} // namespace

std::string SanitizeIdentifier(const std::string& text) {
  std::string out = text;
  for (auto& c : out) {
    if (!std::isalnum(static_cast<unsigned char>(c))) {
      c = '_';
    }
  }
  return out;
}

std::string DdlBuilder::ColumnType(const std::string& type) const {
  if (dialect_ == SqlDialect::kOracle) {
    return type;
  }

  const auto upper = ToUpper(type);
  if (StartsWith(upper, "VARCHAR2")) {
    return "VARCHAR" + type.substr(8);
  }
  if (StartsWith(upper, "NUMBER")) {
    return "NUMERIC" + type.substr(6);
  }
  if (upper == "CLOB") {
    return "TEXT";
  }
  return type;
}

std::string DdlBuilder::ColumnList(const model::TableSchema& schema) const {
  std::string out;
  for (const auto& column : schema.Columns()) {
    if (!out.empty()) {
      out += ", ";
    }
    out += column.name + " " + ColumnType(column.type);
    if (!column.nullable) {
      out += " NOT NULL";
    }
  }
  return out;
}

std::string DdlBuilder::OraclePartitionClause(PartitionStrategy strategy) const {
  switch (strategy) {
    case PartitionStrategy::kHash:
      return std::string(" PARTITION BY HASH (") + sys::kRecordSeq + ") PARTITIONS " + std::to_string(kHashPartitions);
    case PartitionStrategy::kRangeDate:
      return std::string(" PARTITION BY RANGE (") + sys::kCreatedTimestamp +
             ") (PARTITION P_CURRENT VALUES LESS THAN (SYSDATE + 1), PARTITION P_FUTURE VALUES LESS THAN (MAXVALUE))";
    case PartitionStrategy::kRangeNumber:
      return std::string(" PARTITION BY RANGE (") + sys::kRecordSeq + ") (PARTITION P_LOW VALUES LESS THAN (" +
             std::to_string(kRangeNumberBoundary) + "), PARTITION P_HIGH VALUES LESS THAN (MAXVALUE))";
    case PartitionStrategy::kList:
      return std::string(" PARTITION BY LIST (") + sys::kProcessingStatus +
             ") (PARTITION P_PENDING VALUES ('PENDING'), PARTITION P_PROCESSING VALUES ('PROCESSING'),"
             " PARTITION P_COMPLETED VALUES ('COMPLETED', 'FAILED'))";
    case PartitionStrategy::kNone:
    default:
      return {};
  }
}

std::vector<std::string> DdlBuilder::PostgresPartitions(const std::string& table, PartitionStrategy strategy, util::TimePoint now) const {
  std::vector<std::string> out;
  const auto               child = [&](const std::string& suffix, const std::string& bounds) {
    out.push_back("CREATE TABLE " + table + "_" + suffix + " PARTITION OF " + table + " " + bounds);
  };

  switch (strategy) {
    case PartitionStrategy::kHash:
      for (int i = 0; i < kHashPartitions; ++i) {
        child("P" + std::to_string(i),
              "FOR VALUES WITH (MODULUS " + std::to_string(kHashPartitions) + ", REMAINDER " + std::to_string(i) + ")");
      }
      break;
    case PartitionStrategy::kRangeDate: {
      const auto tomorrow = "'" + util::FormatDate(now + std::chrono::hours(24)) + "'";
      child("P_CURRENT", "FOR VALUES FROM (MINVALUE) TO (" + tomorrow + ")");
      child("P_FUTURE", "FOR VALUES FROM (" + tomorrow + ") TO (MAXVALUE)");
      break;
    }
    case PartitionStrategy::kRangeNumber: {
      const auto boundary = std::to_string(kRangeNumberBoundary);
      child("P_LOW", "FOR VALUES FROM (MINVALUE) TO (" + boundary + ")");
      child("P_HIGH", "FOR VALUES FROM (" + boundary + ") TO (MAXVALUE)");
      break;
    }
    case PartitionStrategy::kList:
      child("P_PENDING", "FOR VALUES IN ('PENDING')");
      child("P_PROCESSING", "FOR VALUES IN ('PROCESSING')");
      child("P_COMPLETED", "FOR VALUES IN ('COMPLETED', 'FAILED')");
      break;
    case PartitionStrategy::kNone:
      break;
  }
  return out;
}

std::vector<std::string> DdlBuilder::CreateTable(const std::string& table, const model::TableSchema& schema, util::TimePoint now) const {
  std::string create = "CREATE TABLE " + table + " (" + ColumnList(schema) + ")";

  switch (dialect_) {
    case SqlDialect::kOracle:
      if (schema.Compression()) {
        create += " COMPRESS FOR OLTP";
      }
      create += OraclePartitionClause(schema.Partition());
      return {create};

    case SqlDialect::kPostgres: {
      switch (schema.Partition()) {
        case PartitionStrategy::kHash:
          create += std::string(" PARTITION BY HASH (") + sys::kRecordSeq + ")";
          break;
        case PartitionStrategy::kRangeDate:
          create += std::string(" PARTITION BY RANGE (") + sys::kCreatedTimestamp + ")";
          break;
        case PartitionStrategy::kRangeNumber:
          create += std::string(" PARTITION BY RANGE (") + sys::kRecordSeq + ")";
          break;
        case PartitionStrategy::kList:
          create += std::string(" PARTITION BY LIST (") + sys::kProcessingStatus + ")";
          break;
        case PartitionStrategy::kNone:
          break;
      }
      std::vector<std::string> out{create};
      auto                     children = PostgresPartitions(table, schema.Partition(), now);
      out.insert(out.end(), children.begin(), children.end());
      return out;
    }

    case SqlDialect::kSqlite:
    default:
      return {create};
  }
}

std::optional<std::string> DdlBuilder::EncryptTable(const std::string& table) const {
  if (dialect_ != SqlDialect::kOracle) {
    return std::nullopt;
  }
  return "ALTER TABLE " + table + " ENCRYPTION USING 'AES256' ENCRYPT";
}

std::vector<std::string> DdlBuilder::CreateIndexes(const std::string& table, const model::TableSchema& schema) const {
  std::vector<std::string> out;

  if (IsIndexed(schema, sys::kExecutionId) && IsIndexed(schema, sys::kProcessingStatus)) {
    out.push_back(Index(table, "EXEC_STATUS", std::string(sys::kExecutionId) + ", " + sys::kProcessingStatus));
  }
  if (IsIndexed(schema, sys::kCorrelationId)) {
    out.push_back(Index(table, "CORR_ID", sys::kCorrelationId));
  }

  for (const auto& column : schema.Columns()) {
    if (column.indexed && !StartsWith(column.name, sys::kReservedPrefix)) {
      out.push_back(Index(table, SanitizeIdentifier(column.name), column.name));
    }
  }
  return out;
}

std::string DdlBuilder::DropTable(const std::string& table) const {
  if (dialect_ == SqlDialect::kOracle) {
    return "DROP TABLE " + table + " PURGE";
  }
  return "DROP TABLE " + table;
}

std::optional<std::string> DdlBuilder::CompressTable(const std::string& table) const {
  if (dialect_ != SqlDialect::kOracle) {
    return std::nullopt;
  }
  return "ALTER TABLE " + table + " COMPRESS FOR OLTP";
}

std::optional<std::string> DdlBuilder::CacheTable(const std::string& table) const {
  if (dialect_ != SqlDialect::kOracle) {
    return std::nullopt;
  }
  return "ALTER TABLE " + table + " CACHE";
}

std::string DdlBuilder::PerformanceIndex(const std::string& table) const {
  return Index(table, "PERF_OPT", std::string(sys::kProcessingStatus) + ", " + sys::kCreatedTimestamp);
}

} // namespace staging::exec
