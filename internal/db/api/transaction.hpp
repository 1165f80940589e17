#pragma once

namespace staging::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes
  - Destructor rolls back if not committed

  SQLite: BEGIN IMMEDIATE, one open transaction per connection
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot + write set merged on commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace staging::db
