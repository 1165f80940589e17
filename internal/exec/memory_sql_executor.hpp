#pragma once

#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/exec/sql_executor.hpp"

namespace staging::exec {

/*
  Dry-run executor.

  Records every statement and tracks which tables exist so the full
  lifecycle can run without a database. DROP of an unknown table reports
  NotFound like a real engine. Statements containing a registered
  substring fail with the registered code.
*/
class MemorySqlExecutor final : public SqlExecutor {
 public:
  explicit MemorySqlExecutor(SqlDialect dialect = SqlDialect::kOracle) : dialect_(dialect) {
  }

  db::Result Execute(const std::string& statement) override;

  SqlDialect Dialect() const override {
    return dialect_;
  }

  void FailOn(std::string substring, db::ErrorCode code = db::ErrorCode::InternalError, std::string message = "injected failure");
  void ClearFailures();

  // Runs before each statement, outside the executor lock.
  void SetBeforeExecute(std::function<void(const std::string&)> hook);

  std::vector<std::string> Statements() const;
  bool                     HasTable(const std::string& table) const;
  std::size_t              TableCount() const;

 private:
  struct Failure {
    std::string   substring;
    db::ErrorCode code;
    std::string   message;
  };

  SqlDialect dialect_;

  mutable std::mutex                       mutex_;
  std::vector<std::string>                 statements_;
  std::set<std::string>                    tables_;
  std::vector<Failure>                     failures_;
  std::function<void(const std::string&)> before_execute_;
};

} // namespace staging::exec
