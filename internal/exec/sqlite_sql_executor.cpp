#include "internal/exec/sqlite_sql_executor.hpp"

#include <mutex>

namespace staging::exec {

SqliteSqlExecutor::SqliteSqlExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

db::Result SqliteSqlExecutor::Execute(const std::string& statement) {
  std::lock_guard<std::mutex> lock(db_->TxMutex());

  char* err = nullptr;
  int   rc  = sqlite3_exec(db_->Handle(), statement.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return db::Result::Ok();
  }

  std::string message = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);

  if (message.find("no such table") != std::string::npos) {
    return db::Result::Err(db::ErrorCode::NotFound, message);
  }
  if (message.find("already exists") != std::string::npos) {
    return db::Result::Err(db::ErrorCode::AlreadyExists, message);
  }
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return db::Result::Err(db::ErrorCode::Busy, message);
    case SQLITE_IOERR:
      return db::Result::Err(db::ErrorCode::IOError, message);
    default:
      return db::Result::Err(db::ErrorCode::InternalError, message);
  }
}

} // namespace staging::exec
