#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include "internal/config/config_loader.hpp"

#include <spdlog/spdlog.h>

namespace {

using staging::observability::FormatFields;
using staging::observability::ParseLogLevel;

void TestFieldsAreKeyValuePairs() {
  assert(FormatFields({}).empty());
  assert(FormatFields({staging::observability::StringField("table", "STG_EXEC1_11_1A2B3C"),
                       staging::observability::IntField("records", 2000000),
                       staging::observability::BoolField("compressed", true)}) ==
         "table=STG_EXEC1_11_1A2B3C records=2000000 compressed=true");
  assert(FormatFields({staging::observability::DoubleField("error_rate", 0.25)}) == "error_rate=0.25");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatFields({staging::observability::StringField("reason", "operator request")}) == "reason=\"operator request\"");
  assert(FormatFields({staging::observability::StringField("reason", "")}) == "reason=\"\"");
  assert(FormatFields({staging::observability::StringField("sql", "a=\"b\"")}) == "sql=\"a=\\\"b\\\"\"");
}

void TestLevelNames() {
  assert(ParseLogLevel("debug") == spdlog::level::debug);
  assert(ParseLogLevel("info") == spdlog::level::info);
  assert(ParseLogLevel("warn") == spdlog::level::warn);
  assert(ParseLogLevel("warning") == spdlog::level::warn);
  assert(ParseLogLevel("error") == spdlog::level::err);
  assert(ParseLogLevel("off") == spdlog::level::off);
  assert(!ParseLogLevel("verbose").has_value());
}

void TestUnknownLevelFallsBackToInfo() {
  ::unsetenv("STAGING_LOG_LEVEL");
  auto config = staging::config::ConfigLoader::LoadFromString("logging:\n  level: verbose\n");
  staging::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  ::setenv("STAGING_LOG_LEVEL", "debug", 1);
  staging::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);
  ::unsetenv("STAGING_LOG_LEVEL");

  STAGING_LOG_INFO("logging test", {staging::observability::StringField("reason", "ttl expired")});
  staging::observability::ShutdownLogging();
}

} // namespace

int main() {
  TestFieldsAreKeyValuePairs();
  TestValuesWithSpacesAreQuoted();
  TestLevelNames();
  TestUnknownLevelFallsBackToInfo();

  std::cout << "staging_manager_unit_logging: pass\n";
  return 0;
}
