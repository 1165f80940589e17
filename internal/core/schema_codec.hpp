#pragma once

#include <string>

#include "internal/model/table_schema.hpp"

namespace staging::core {

// Optimized schema <-> StoredTableSchema JSON kept on the definition record.
std::string        EncodeSchema(const model::TableSchema& schema);
model::TableSchema DecodeSchema(const std::string& json);

} // namespace staging::core
