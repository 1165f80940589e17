#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/model/staging_types.hpp"

namespace staging::model {

struct ColumnSpec {
  std::string name;
  std::string type;
  bool        nullable = true;
  bool        indexed  = false;
};

/*
  Optimized staging table layout.

  Built once per creation through TableSchema::Builder and immutable
  afterwards. Column order is the order columns were added.
*/
class TableSchema {
 public:
  class Builder {
   public:
    Builder& AddColumn(ColumnSpec column) {
      columns_.push_back(std::move(column));
      return *this;
    }

    Builder& Partition(PartitionStrategy strategy) {
      partition_ = strategy;
      return *this;
    }

    Builder& Compression(bool enabled) {
      compression_ = enabled;
      return *this;
    }

    Builder& Encryption(bool enabled) {
      encryption_ = enabled;
      return *this;
    }

    TableSchema Build() && {
      return TableSchema(std::move(columns_), partition_, compression_, encryption_);
    }

    TableSchema Build() const& {
      return TableSchema(columns_, partition_, compression_, encryption_);
    }

   private:
    std::vector<ColumnSpec> columns_;
    PartitionStrategy       partition_   = PartitionStrategy::kNone;
    bool                    compression_ = false;
    bool                    encryption_  = false;
  };

  TableSchema() = default;

  const std::vector<ColumnSpec>& Columns() const {
    return columns_;
  }

  PartitionStrategy Partition() const {
    return partition_;
  }

  bool Compression() const {
    return compression_;
  }

  bool Encryption() const {
    return encryption_;
  }

  const ColumnSpec* FindColumn(const std::string& name) const {
    for (const auto& column : columns_) {
      if (column.name == name) {
        return &column;
      }
    }
    return nullptr;
  }

 private:
  TableSchema(std::vector<ColumnSpec> columns, PartitionStrategy partition, bool compression, bool encryption)
      : columns_(std::move(columns)), partition_(partition), compression_(compression), encryption_(encryption) {
  }

  std::vector<ColumnSpec> columns_;
  PartitionStrategy       partition_   = PartitionStrategy::kNone;
  bool                    compression_ = false;
  bool                    encryption_  = false;
};

// Columns injected into every staging table.
namespace system_columns {
inline constexpr const char* kCorrelationId    = "STG_CORRELATION_ID";
inline constexpr const char* kExecutionId      = "STG_EXECUTION_ID";
inline constexpr const char* kCreatedTimestamp = "STG_CREATED_TIMESTAMP";
inline constexpr const char* kRecordSeq        = "STG_RECORD_SEQ";
inline constexpr const char* kProcessingStatus = "STG_PROCESSING_STATUS";
inline constexpr const char* kReservedPrefix   = "STG_";
} // namespace system_columns

} // namespace staging::model
