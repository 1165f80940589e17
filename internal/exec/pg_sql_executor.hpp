#pragma once

#include <memory>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/exec/sql_executor.hpp"

namespace staging::exec {

// Executes each statement in its own pqxx::work on a pooled connection.
class PgSqlExecutor final : public SqlExecutor {
 public:
  explicit PgSqlExecutor(std::shared_ptr<db::postgres::PgPool> pool);

  db::Result Execute(const std::string& statement) override;

  SqlDialect Dialect() const override {
    return SqlDialect::kPostgres;
  }

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
};

} // namespace staging::exec
