#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/staging_types.hpp"
#include "internal/model/table_schema.hpp"

namespace staging::core {

struct PartitionPolicy {
  uint64_t hash_min_records         = 1'000'000;
  uint64_t range_number_min_records = 5'000'000;
  uint64_t range_date_min_records   = 10'000'000;
};

/*
  Stateless partition strategy decision.

  Thresholds are strict: a count equal to a threshold falls into the
  band below it. LIST is never selected here; it is only reachable
  through an explicit caller override.
*/
class PartitionSelector {
 public:
  explicit PartitionSelector(PartitionPolicy policy = {}) : policy_(policy) {
  }

  model::PartitionStrategy Select(uint64_t expected_records, bool has_date_column, bool has_numeric_id_column) const;

  model::PartitionStrategy Select(uint64_t expected_records, const std::vector<model::ColumnSpec>& columns) const {
    return Select(expected_records, HasDateColumn(columns), HasNumericIdColumn(columns));
  }

  // Type mentions DATE or TIMESTAMP.
  static bool HasDateColumn(const std::vector<model::ColumnSpec>& columns);

  // Name mentions ID, KEY or SEQ and type is NUMBER, INTEGER or BIGINT.
  static bool HasNumericIdColumn(const std::vector<model::ColumnSpec>& columns);

  const PartitionPolicy& Policy() const {
    return policy_;
  }

 private:
  PartitionPolicy policy_;
};

} // namespace staging::core
