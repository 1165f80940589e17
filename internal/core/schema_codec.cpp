#include "internal/core/schema_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "staging/v1/schema.pb.h"

namespace staging::core {

std::string EncodeSchema(const model::TableSchema& schema) {
  staging::v1::StoredTableSchema stored;
  for (const auto& column : schema.Columns()) {
    auto* out = stored.add_columns();
    out->set_name(column.name);
    out->set_type(column.type);
    out->set_nullable(column.nullable);
    out->set_indexed(column.indexed);
  }
  stored.set_partition_strategy(std::string(model::ToString(schema.Partition())));
  stored.set_compression(schema.Compression());
  stored.set_encryption(schema.Encryption());

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(stored, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("encode table schema: " + std::string(status.message()));
  }
  return json;
}

model::TableSchema DecodeSchema(const std::string& json) {
  staging::v1::StoredTableSchema stored;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, &stored, options);
  if (!status.ok()) {
    throw std::runtime_error("decode table schema: " + std::string(status.message()));
  }

  model::TableSchema::Builder builder;
  for (const auto& column : stored.columns()) {
    builder.AddColumn({column.name(), column.type(), column.nullable(), column.indexed()});
  }
  return std::move(builder)
      .Partition(model::PartitionStrategyFromString(stored.partition_strategy()).value_or(model::PartitionStrategy::kNone))
      .Compression(stored.compression())
      .Encryption(stored.encryption())
      .Build();
}

} // namespace staging::core
