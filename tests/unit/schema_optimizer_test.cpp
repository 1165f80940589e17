#include "internal/core/schema_optimizer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/core/schema_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using staging::core::SchemaContext;
using staging::core::SchemaOptimizer;
using staging::core::SchemaPolicy;
using staging::model::PartitionStrategy;
using staging::model::TableSchema;

constexpr const char* kTransactionsSchema = R"json({"columns": [
  {"name": "ACCOUNT_ID", "type": "VARCHAR2(100)", "nullable": false},
  {"name": "CUSTOMER_NAME", "type": "VARCHAR2(200)"},
  {"name": "STATUS_CODE", "type": "VARCHAR2(100)"},
  {"name": "AMOUNT", "type": "NUMBER"},
  {"name": "INTEREST_RATE", "type": "NUMBER"},
  {"name": "ITEM_COUNT", "type": "NUMBER"},
  {"name": "NOTES", "type": "VARCHAR2(4000)"},
  {"name": "POSTING_DATE", "type": "DATE"}
]})json";

bool ThrowsValidation(const SchemaOptimizer& optimizer, const std::string& json) {
  try {
    (void)optimizer.Parse(json);
  } catch (const staging::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestColumnTypesAreTunedByName() {
  const SchemaOptimizer optimizer;

  assert(optimizer.TuneColumnType("VARCHAR2(100)", "ACCOUNT_ID", 0) == "VARCHAR2(50)");
  assert(optimizer.TuneColumnType("VARCHAR2(100)", "merchant_key", 0) == "VARCHAR2(50)");
  assert(optimizer.TuneColumnType("VARCHAR2(200)", "CUSTOMER_NAME", 0) == "VARCHAR2(500)");
  assert(optimizer.TuneColumnType("VARCHAR2(10)", "LONG_DESCRIPTION", 0) == "VARCHAR2(500)");
  assert(optimizer.TuneColumnType("VARCHAR2(100)", "STATUS", 0) == "VARCHAR2(20)");
  assert(optimizer.TuneColumnType("NUMBER", "AMOUNT", 0) == "NUMBER(15,2)");
  assert(optimizer.TuneColumnType("NUMBER", "INTEREST_RATE", 0) == "NUMBER(5,4)");
  assert(optimizer.TuneColumnType("NUMBER", "ITEM_COUNT", 0) == "NUMBER(10)");
  assert(optimizer.TuneColumnType("DATE", "POSTING_DATE", 0) == "DATE");

  // large volumes shrink wide free-text columns
  assert(optimizer.TuneColumnType("VARCHAR2(4000)", "NOTES", 1'000'000) == "VARCHAR2(4000)");
  assert(optimizer.TuneColumnType("VARCHAR2(4000)", "NOTES", 1'000'001) == "VARCHAR2(1000)");
}

void TestIndexSelection() {
  const SchemaOptimizer optimizer;

  assert(optimizer.ShouldIndex("ACCOUNT_ID", 1000));
  assert(optimizer.ShouldIndex("STATUS_CODE", 1000));
  assert(optimizer.ShouldIndex("posting_date", 1000));
  assert(!optimizer.ShouldIndex("AMOUNT", 1000));
  assert(optimizer.ShouldIndex("STG_ANYTHING", 50'000'000));

  // above the selective threshold only short identifier columns keep one
  assert(optimizer.ShouldIndex("ACCOUNT_ID", 6'000'000));
  assert(!optimizer.ShouldIndex("STATUS_CODE", 6'000'000));
  assert(!optimizer.ShouldIndex("VERY_LONG_ACCOUNT_ID_COLUMN", 6'000'000));
}

void TestCompressionAndEncryptionDecisions() {
  SchemaPolicy policy;
  policy.encryption_enabled = true;
  const SchemaOptimizer optimizer(policy);

  SchemaContext context;
  assert(!optimizer.ShouldCompress(context));
  context.expected_records = 1'000'001;
  assert(optimizer.ShouldCompress(context));
  context.expected_records = 0;
  context.ttl_hours        = 48;
  assert(!optimizer.ShouldCompress(context));
  context.ttl_hours = 49;
  assert(optimizer.ShouldCompress(context));
  context.ttl_hours         = 0;
  context.security_required = true;
  assert(optimizer.ShouldCompress(context));
  assert(optimizer.ShouldEncrypt(context));

  const SchemaOptimizer no_encryption;
  assert(!no_encryption.ShouldEncrypt(context));
}

void TestOptimizedSchemaLayout() {
  const SchemaOptimizer optimizer;

  SchemaContext context;
  context.expected_records = 2'000'000;
  context.partition        = PartitionStrategy::kHash;

  const TableSchema schema = optimizer.Optimize(kTransactionsSchema, context);
  assert(schema.Columns().size() == 8 + 5);
  assert(schema.Partition() == PartitionStrategy::kHash);
  assert(schema.Compression());
  assert(!schema.Encryption());

  const auto* account = schema.FindColumn("ACCOUNT_ID");
  assert(account != nullptr);
  assert(account->type == "VARCHAR2(50)");
  assert(!account->nullable);
  assert(account->indexed);
  assert(!schema.FindColumn("AMOUNT")->indexed);
  assert(schema.FindColumn("NOTES")->type == "VARCHAR2(1000)");

  // system columns trail the request columns in a fixed order
  const auto& columns = schema.Columns();
  assert(columns[8].name == "STG_CORRELATION_ID");
  assert(columns[9].name == "STG_EXECUTION_ID" && !columns[9].nullable);
  assert(columns[10].name == "STG_CREATED_TIMESTAMP" && columns[10].type == "TIMESTAMP");
  assert(columns[11].name == "STG_RECORD_SEQ" && columns[11].type == "NUMBER(19)");
  assert(columns[12].name == "STG_PROCESSING_STATUS" && columns[12].type == "VARCHAR2(20)");
  for (std::size_t i = 8; i < columns.size(); ++i) {
    assert(columns[i].indexed);
  }
}

void TestReservedPrefixColumnsAreSkipped() {
  const SchemaOptimizer optimizer;

  const auto parsed = optimizer.Parse(R"json({"columns": [
    {"name": "ACCOUNT_ID", "type": "VARCHAR2(100)"},
    {"name": "stg_record_seq", "type": "NUMBER"}
  ]})json");
  assert(!parsed.malformed);
  assert(parsed.columns.size() == 1);

  const auto schema = optimizer.Optimize(parsed, SchemaContext{});
  assert(schema.Columns().size() == 1 + 5);
}

void TestMalformedRequestYieldsMinimalSchema() {
  const SchemaOptimizer optimizer;

  const auto parsed = optimizer.Parse(R"json({"columns": [
    {"name": "ACCOUNT_ID", "type": "VARCHAR2(100)"},
    {"name": "", "type": "NUMBER"},
    {"name": "AMOUNT"}
  ]})json");
  assert(parsed.malformed);
  assert(parsed.columns.size() == 1);

  SchemaContext context;
  context.expected_records  = 50'000'000;
  context.security_required = true;
  context.partition         = PartitionStrategy::kRangeDate;

  const auto schema = optimizer.Optimize(parsed, context);
  assert(schema.Partition() == PartitionStrategy::kNone);
  assert(!schema.Compression());
  assert(!schema.Encryption());
  assert(schema.Columns().size() == 1 + 5);
  for (const auto& column : schema.Columns()) {
    assert(!column.indexed);
  }
  // types pass through untouched
  assert(schema.FindColumn("ACCOUNT_ID")->type == "VARCHAR2(100)");
}

void TestUnknownKeysStillGetTunedSchema() {
  const SchemaOptimizer optimizer;

  const auto parsed = optimizer.Parse(R"json({"tableName": "txn", "columns": [
    {"name": "ACCOUNT_ID", "type": "VARCHAR2(100)", "width": 12},
    {"name": "POSTING_DATE", "type": "DATE", "comment": "booking day"}
  ]})json");
  assert(!parsed.malformed);
  assert(parsed.columns.size() == 2);

  SchemaContext context;
  context.expected_records = 12'000'000;
  context.partition        = PartitionStrategy::kRangeDate;

  const auto schema = optimizer.Optimize(parsed, context);
  assert(schema.Partition() == PartitionStrategy::kRangeDate);
  assert(schema.Compression());
  assert(schema.FindColumn("ACCOUNT_ID")->type == "VARCHAR2(50)");
  assert(schema.FindColumn("ACCOUNT_ID")->indexed);
}

void TestUnusableRequestsAreRejected() {
  const SchemaOptimizer optimizer;

  assert(ThrowsValidation(optimizer, ""));
  assert(ThrowsValidation(optimizer, "   "));
  assert(ThrowsValidation(optimizer, "not json"));
  assert(ThrowsValidation(optimizer, R"({"columns": []})"));
  assert(ThrowsValidation(optimizer, R"({"columns": [{"name": "STG_ONLY", "type": "NUMBER"}]})"));
}

void TestSchemaCodecKeepsLayout() {
  const SchemaOptimizer optimizer;
  SchemaContext         context;
  context.expected_records = 12'000'000;
  context.partition        = PartitionStrategy::kRangeDate;

  const auto schema  = optimizer.Optimize(kTransactionsSchema, context);
  const auto decoded = staging::core::DecodeSchema(staging::core::EncodeSchema(schema));

  assert(decoded.Partition() == PartitionStrategy::kRangeDate);
  assert(decoded.Compression() == schema.Compression());
  assert(decoded.Columns().size() == schema.Columns().size());
  assert(decoded.FindColumn("ACCOUNT_ID")->indexed == schema.FindColumn("ACCOUNT_ID")->indexed);
}

} // namespace

int main() {
  TestColumnTypesAreTunedByName();
  TestIndexSelection();
  TestCompressionAndEncryptionDecisions();
  TestOptimizedSchemaLayout();
  TestReservedPrefixColumnsAreSkipped();
  TestMalformedRequestYieldsMinimalSchema();
  TestUnknownKeysStillGetTunedSchema();
  TestUnusableRequestsAreRejected();
  TestSchemaCodecKeepsLayout();

  std::cout << "staging_manager_unit_schema_optimizer: pass\n";
  return 0;
}
