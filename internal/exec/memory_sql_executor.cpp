#include "internal/exec/memory_sql_executor.hpp"

#include <sstream>

#include "internal/util/strings.hpp"

namespace staging::exec {

namespace {

// Third token of "CREATE TABLE <name> ..." / "DROP TABLE <name> ...".
std::string TableOperand(const std::string& statement) {
  std::istringstream in(statement);
  std::string        verb;
  std::string        object;
  std::string        name;
  in >> verb >> object >> name;
  return name;
}

} // namespace

db::Result MemorySqlExecutor::Execute(const std::string& statement) {
  std::function<void(const std::string&)> hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hook = before_execute_;
  }
  if (hook) {
    hook(statement);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  statements_.push_back(statement);

  for (const auto& failure : failures_) {
    if (statement.find(failure.substring) != std::string::npos) {
      return db::Result::Err(failure.code, failure.message);
    }
  }

  if (util::StartsWith(statement, "CREATE TABLE ")) {
    const auto table = TableOperand(statement);
    if (!tables_.insert(table).second) {
      return db::Result::Err(db::ErrorCode::AlreadyExists, "table already exists: " + table);
    }
  } else if (util::StartsWith(statement, "DROP TABLE ")) {
    const auto table = TableOperand(statement);
    if (tables_.erase(table) == 0) {
      return db::Result::Err(db::ErrorCode::NotFound, "table does not exist: " + table);
    }
  } else if (util::StartsWith(statement, "ALTER TABLE ")) {
    const auto table = TableOperand(statement);
    if (!tables_.contains(table)) {
      return db::Result::Err(db::ErrorCode::NotFound, "table does not exist: " + table);
    }
  }
  return db::Result::Ok();
}

void MemorySqlExecutor::FailOn(std::string substring, db::ErrorCode code, std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.push_back({std::move(substring), code, std::move(message)});
}

void MemorySqlExecutor::ClearFailures() {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.clear();
}

void MemorySqlExecutor::SetBeforeExecute(std::function<void(const std::string&)> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  before_execute_ = std::move(hook);
}

std::vector<std::string> MemorySqlExecutor::Statements() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return statements_;
}

bool MemorySqlExecutor::HasTable(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tables_.contains(table);
}

std::size_t MemorySqlExecutor::TableCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tables_.size();
}

} // namespace staging::exec
