#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace staging::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  A connection carries at most one open transaction; TxMutex() is held by
  SqliteTransaction for its lifetime and by the SQL executor around each
  statement when both share the connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute one or more SQL statements; throws on failure.
  void Exec(const std::string& sql);

  // Caller must sqlite3_finalize.
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace staging::db::sqlite
