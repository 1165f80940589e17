#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <optional>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace staging::observability {
namespace {

constexpr char kLoggerName[]     = "staging-manager";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LoggingSettings {
  std::string level;
  std::string pattern;
  bool        include_trace_context = false;
};

// Environment first, then the config value, then the fallback.
std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

LoggingSettings ResolveSettings(const staging::runtime::config::RuntimeConfig& config) {
  const auto&     logging = config.logging();
  LoggingSettings settings;
  settings.level   = Setting("STAGING_LOG_LEVEL", logging.level(), "info");
  settings.pattern = Setting("STAGING_LOG_PATTERN", logging.pattern(), kDefaultPattern);

  settings.include_trace_context = logging.include_trace_context();
  if (const char* include_trace = std::getenv("STAGING_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    settings.include_trace_context = value == "1" || value == "true";
  }
  return settings;
}

bool g_include_trace_context{false};

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  return value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  char trace_hex[2 * opentelemetry::trace::TraceId::kSize];
  char span_hex[2 * opentelemetry::trace::SpanId::kSize];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  return "trace_id=" + std::string(trace_hex, sizeof(trace_hex)) + " span_id=" + std::string(span_hex, sizeof(span_hex));
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.2f}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
  if (name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += field.key;
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const staging::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);

  const auto level = ParseLogLevel(settings.level);
  logger->set_level(level.value_or(spdlog::level::info));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.include_trace_context;

  if (!level) {
    LogWarn("Unknown log level, using info", {StringField("level", settings.level)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& part : {FormatFields(fields), TraceContextFields()}) {
    if (!part.empty()) {
      line.push_back(' ');
      line += part;
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace staging::observability
