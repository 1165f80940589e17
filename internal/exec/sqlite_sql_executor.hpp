#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/exec/sql_executor.hpp"

namespace staging::exec {

// Executes staging DDL on a SQLite connection. The connection may be
// shared with SqliteRepository; statements serialize on its tx mutex.
class SqliteSqlExecutor final : public SqlExecutor {
 public:
  explicit SqliteSqlExecutor(std::shared_ptr<db::sqlite::SqliteDB> db);

  db::Result Execute(const std::string& statement) override;

  SqlDialect Dialect() const override {
    return SqlDialect::kSqlite;
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace staging::exec
