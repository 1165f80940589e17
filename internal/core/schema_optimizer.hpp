#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/table_schema.hpp"

namespace staging::core {

struct SchemaPolicy {
  uint64_t compression_min_records     = 1'000'000;
  uint32_t compression_min_ttl_hours   = 48;
  uint64_t selective_index_min_records = 5'000'000;
  uint64_t shrink_text_min_records     = 1'000'000;
  bool     encryption_enabled          = false;
};

struct SchemaContext {
  uint64_t                 expected_records  = 0;
  bool                     security_required = false;
  uint32_t                 ttl_hours         = 0;
  model::PartitionStrategy partition         = model::PartitionStrategy::kNone;
};

// Columns read from a creation request. Unknown JSON keys are ignored;
// malformed is set when a column entry lacked a name or type and was dropped.
struct ParsedColumns {
  std::vector<model::ColumnSpec> columns;
  bool                           malformed = false;
};

/*
  Turns a request column list into the tuned staging schema.

  Types are tuned by column name, indexes follow the name-based policy
  (restricted for very large volumes), and the five STG_ system columns
  are appended. A malformed request yields the minimal schema: parsed
  columns unchanged, nothing indexed, no partitioning, no compression and
  no encryption.
*/
class SchemaOptimizer {
 public:
  explicit SchemaOptimizer(SchemaPolicy policy = {}) : policy_(policy) {
  }

  // Throws util::ValidationError when no column can be recovered.
  ParsedColumns Parse(const std::string& schema_json) const;

  model::TableSchema Optimize(const ParsedColumns& parsed, const SchemaContext& context) const;

  model::TableSchema Optimize(const std::string& schema_json, const SchemaContext& context) const {
    return Optimize(Parse(schema_json), context);
  }

  std::string TuneColumnType(const std::string& type, const std::string& name, uint64_t expected_records) const;
  bool        ShouldIndex(const std::string& name, uint64_t expected_records) const;
  bool        ShouldCompress(const SchemaContext& context) const;
  bool        ShouldEncrypt(const SchemaContext& context) const;

  static std::vector<model::ColumnSpec> SystemColumns();

  const SchemaPolicy& Policy() const {
    return policy_;
  }

 private:
  SchemaPolicy policy_;
};

} // namespace staging::core
