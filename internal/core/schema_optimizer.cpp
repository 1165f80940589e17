#include "internal/core/schema_optimizer.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "staging/v1/schema.pb.h"

namespace staging::core {

namespace {

namespace sys = model::system_columns;
using observability::IntField;
using observability::StringField;

// Unknown keys are ignored; only JSON that does not fit the column shape fails.
bool ParseInto(const std::string& json, staging::v1::SchemaDefinition* out, std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, out, options);
  if (!status.ok()) {
    *error = std::string(status.message());
    return false;
  }
  return true;
}

} // namespace

ParsedColumns SchemaOptimizer::Parse(const std::string& schema_json) const {
  if (util::IsBlank(schema_json)) {
    throw util::ValidationError("schema definition is empty");
  }

  ParsedColumns                 parsed;
  staging::v1::SchemaDefinition definition;
  std::string                   error;

  if (!ParseInto(schema_json, &definition, &error)) {
    throw util::ValidationError("invalid schema definition: " + error);
  }

  for (const auto& column : definition.columns()) {
    if (util::IsBlank(column.name()) || util::IsBlank(column.type())) {
      parsed.malformed = true;
      continue;
    }
    if (util::StartsWith(util::ToUpper(column.name()), sys::kReservedPrefix)) {
      STAGING_LOG_WARN("skipping column with reserved prefix", {StringField("column", column.name())});
      continue;
    }
    parsed.columns.push_back({column.name(), column.type(), column.has_nullable() ? column.nullable() : true, false});
  }

  if (parsed.columns.empty()) {
    throw util::ValidationError("schema definition has no usable columns");
  }
  return parsed;
}

model::TableSchema SchemaOptimizer::Optimize(const ParsedColumns& parsed, const SchemaContext& context) const {
  model::TableSchema::Builder builder;

  if (parsed.malformed) {
    for (const auto& column : parsed.columns) {
      builder.AddColumn({column.name, column.type, column.nullable, false});
    }
    for (auto column : SystemColumns()) {
      column.indexed = false;
      builder.AddColumn(std::move(column));
    }
    STAGING_LOG_INFO("built minimal staging schema", {IntField("columns", static_cast<int64_t>(parsed.columns.size()))});
    return std::move(builder).Build();
  }

  for (const auto& column : parsed.columns) {
    builder.AddColumn({column.name, TuneColumnType(column.type, column.name, context.expected_records), column.nullable,
                       ShouldIndex(column.name, context.expected_records)});
  }
  for (auto& column : SystemColumns()) {
    builder.AddColumn(std::move(column));
  }

  return std::move(builder).Partition(context.partition).Compression(ShouldCompress(context)).Encryption(ShouldEncrypt(context)).Build();
}

std::string SchemaOptimizer::TuneColumnType(const std::string& type, const std::string& name, uint64_t expected_records) const {
  const auto upper_type = util::ToUpper(type);
  const auto upper_name = util::ToUpper(name);

  if (util::StartsWith(upper_type, "VARCHAR")) {
    if (util::Contains(upper_name, "ID") || util::Contains(upper_name, "KEY")) {
      return "VARCHAR2(50)";
    }
    if (util::Contains(upper_name, "NAME") || util::Contains(upper_name, "DESCRIPTION")) {
      return "VARCHAR2(500)";
    }
    if (util::Contains(upper_name, "CODE") || util::Contains(upper_name, "STATUS")) {
      return "VARCHAR2(20)";
    }
  }

  if (util::StartsWith(upper_type, "NUMBER")) {
    if (util::Contains(upper_name, "AMOUNT") || util::Contains(upper_name, "BALANCE")) {
      return "NUMBER(15,2)";
    }
    if (util::Contains(upper_name, "PERCENT") || util::Contains(upper_name, "RATE")) {
      return "NUMBER(5,4)";
    }
    if (util::Contains(upper_name, "COUNT") || util::Contains(upper_name, "QUANTITY")) {
      return "NUMBER(10)";
    }
  }

  if (expected_records > policy_.shrink_text_min_records && upper_type == "VARCHAR2(4000)") {
    return "VARCHAR2(1000)";
  }
  return type;
}

bool SchemaOptimizer::ShouldIndex(const std::string& name, uint64_t expected_records) const {
  const auto upper = util::ToUpper(name);

  if (util::StartsWith(upper, sys::kReservedPrefix)) {
    return true;
  }

  // large tables keep only short identifier indexes
  if (expected_records > policy_.selective_index_min_records) {
    return util::Contains(upper, "ID") && upper.size() < 20;
  }

  for (const char* marker : {"ID", "KEY", "CODE", "STATUS", "DATE", "TIMESTAMP"}) {
    if (util::Contains(upper, marker)) {
      return true;
    }
  }
  return false;
}

bool SchemaOptimizer::ShouldCompress(const SchemaContext& context) const {
  return context.expected_records > policy_.compression_min_records || context.security_required ||
         context.ttl_hours > policy_.compression_min_ttl_hours;
}

bool SchemaOptimizer::ShouldEncrypt(const SchemaContext& context) const {
  return policy_.encryption_enabled && context.security_required;
}

std::vector<model::ColumnSpec> SchemaOptimizer::SystemColumns() {
  return {
      {sys::kCorrelationId, "VARCHAR2(100)", true, true},
      {sys::kExecutionId, "VARCHAR2(100)", false, true},
      {sys::kCreatedTimestamp, "TIMESTAMP", false, true},
      {sys::kRecordSeq, "NUMBER(19)", false, true},
      {sys::kProcessingStatus, "VARCHAR2(20)", true, true},
  };
}

} // namespace staging::core
