#include "internal/exec/pg_sql_executor.hpp"

#include <pqxx/pqxx>

namespace staging::exec {

PgSqlExecutor::PgSqlExecutor(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
}

db::Result PgSqlExecutor::Execute(const std::string& statement) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec(statement);
    tx.commit();
    return db::Result::Ok();
  } catch (const pqxx::undefined_table& e) {
    return db::Result::Err(db::ErrorCode::NotFound, e.what());
  } catch (const pqxx::broken_connection& e) {
    return db::Result::Err(db::ErrorCode::IOError, e.what());
  } catch (const pqxx::sql_error& e) {
    // 42P07 duplicate_table
    if (e.sqlstate() == "42P07") {
      return db::Result::Err(db::ErrorCode::AlreadyExists, e.what());
    }
    return db::Result::Err(db::ErrorCode::InternalError, e.what());
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::InternalError, e.what());
  }
}

} // namespace staging::exec
