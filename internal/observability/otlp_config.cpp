#include <cstdlib>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace staging::observability {

namespace {

std::string DialectLabel(staging::runtime::config::SqlDialect dialect) {
  switch (dialect) {
    case staging::runtime::config::SQL_DIALECT_POSTGRES:
      return "postgres";
    case staging::runtime::config::SQL_DIALECT_SQLITE:
      return "sqlite";
    default:
      return "oracle";
  }
}

} // namespace

OtlpConfig OtlpConfigFromRuntime(const staging::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint     = observability.otlp_endpoint();
  otlp.transport    = observability.transport() == staging::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                    : OtlpTransport::kGrpc;
  otlp.sql_dialect  = DialectLabel(config.execution().dialect());
  otlp.table_prefix = config.lifecycle().table_prefix();
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const char* signal_variable =
      signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_variable)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace staging::observability
