#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace staging::runtime::config {
class RuntimeConfig;
}

namespace staging::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Accepts the spdlog level names plus "warning" and "error".
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

// key=value pairs separated by spaces; values with whitespace, quotes or '='
// are double-quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const staging::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace staging::observability

#define STAGING_LOG_DEBUG(message, ...) ::staging::observability::LogDebug((message), ##__VA_ARGS__)
#define STAGING_LOG_INFO(message, ...) ::staging::observability::LogInfo((message), ##__VA_ARGS__)
#define STAGING_LOG_WARN(message, ...) ::staging::observability::LogWarn((message), ##__VA_ARGS__)
#define STAGING_LOG_ERROR(message, ...) ::staging::observability::LogError((message), ##__VA_ARGS__)
