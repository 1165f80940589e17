#include "internal/core/partition_selector.hpp"

#include "internal/util/strings.hpp"

namespace staging::core {

using model::PartitionStrategy;

PartitionStrategy PartitionSelector::Select(uint64_t expected_records, bool has_date_column, bool has_numeric_id_column) const {
  if (expected_records > policy_.range_date_min_records && has_date_column) {
    return PartitionStrategy::kRangeDate;
  }
  if (expected_records > policy_.range_number_min_records && has_numeric_id_column) {
    return PartitionStrategy::kRangeNumber;
  }
  if (expected_records > policy_.hash_min_records) {
    return PartitionStrategy::kHash;
  }
  return PartitionStrategy::kNone;
}

bool PartitionSelector::HasDateColumn(const std::vector<model::ColumnSpec>& columns) {
  for (const auto& column : columns) {
    const auto type = util::ToUpper(column.type);
    if (util::Contains(type, "DATE") || util::Contains(type, "TIMESTAMP")) {
      return true;
    }
  }
  return false;
}

bool PartitionSelector::HasNumericIdColumn(const std::vector<model::ColumnSpec>& columns) {
  for (const auto& column : columns) {
    const auto name = util::ToUpper(column.name);
    const auto type = util::ToUpper(column.type);
    const bool id_like = util::Contains(name, "ID") || util::Contains(name, "KEY") || util::Contains(name, "SEQ");
    const bool numeric = util::Contains(type, "NUMBER") || util::Contains(type, "INTEGER") || util::Contains(type, "BIGINT");
    if (id_like && numeric) {
      return true;
    }
  }
  return false;
}

} // namespace staging::core
