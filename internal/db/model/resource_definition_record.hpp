#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/staging_types.hpp"

namespace staging::db::model {

/*
  Persistent staging resource row.

  - dropped_at_ms empty means the resource is active.
  - Once dropped_at_ms is set no backend clears it again.
  - table_schema holds the optimized schema as JSON (StoredTableSchema).
*/

struct ResourceDefinitionRecord {
  std::string id; // UUID
  std::string execution_id;
  int64_t     transaction_type_id = 0;
  std::string physical_name;
  std::string table_schema;

  staging::model::PartitionStrategy partition_strategy = staging::model::PartitionStrategy::kNone;
  uint32_t                          ttl_hours          = 0;
  staging::model::CompressionLevel  compression_level  = staging::model::CompressionLevel::kNone;
  bool                              encryption_applied = false;
  staging::model::CleanupPolicy     cleanup_policy     = staging::model::CleanupPolicy::kAutoDrop;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> dropped_at_ms;

  uint64_t    record_count      = 0;
  double      table_size_mb     = 0.0;
  uint64_t    last_access_at_ms = 0;
  std::string optimization_applied;

  bool IsActive() const {
    return !dropped_at_ms.has_value();
  }
};

} // namespace staging::db::model
