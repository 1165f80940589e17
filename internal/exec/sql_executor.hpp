#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"

namespace staging::exec {

enum class SqlDialect {
  kOracle,
  kPostgres,
  kSqlite,
};

constexpr std::string_view ToString(SqlDialect dialect) {
  switch (dialect) {
    case SqlDialect::kPostgres:
      return "POSTGRES";
    case SqlDialect::kSqlite:
      return "SQLITE";
    case SqlDialect::kOracle:
    default:
      return "ORACLE";
  }
}

/*
  Relational engine that receives staging DDL.

  Execute never throws for engine errors; it reports them as db::Result.
  ErrorCode::NotFound means the statement's target object is already
  absent (for example dropping a table that no longer exists).
*/
class SqlExecutor {
 public:
  virtual ~SqlExecutor() = default;

  virtual db::Result Execute(const std::string& statement) = 0;

  virtual SqlDialect Dialect() const = 0;
};

} // namespace staging::exec
