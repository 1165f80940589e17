#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/metrics_sink.hpp"

namespace staging::runtime::config {
class RuntimeConfig;
}

namespace staging::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Exporter settings shared by the trace and metric pipelines. The dialect and
// table prefix are attached to the exported resource so that telemetry from
// several staging managers can be told apart.
struct OtlpConfig {
  std::string   service_name{"staging-manager"};
  std::string   service_version{"0.1.0"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::string   sql_dialect{"oracle"};
  std::string   table_prefix{};
};

OtlpConfig OtlpConfigFromRuntime(const staging::runtime::config::RuntimeConfig& config);

// Explicit endpoint, then the per-signal OTEL_EXPORTER_OTLP_*_ENDPOINT
// variable, then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for
// the transport.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

bool InitializeTracing(const staging::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const staging::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  OpenTelemetry-backed metrics sink.

  Instruments are created lazily on first use of a name: counters as
  uint64 counters, durations as double histograms, gauges as int64
  observable gauges reading the last value set.
*/
class Metrics final : public MetricsSink {
 public:
  Metrics();
  ~Metrics() override;

  Metrics(const Metrics&)            = delete;
  Metrics& operator=(const Metrics&) = delete;

  void IncrementCounter(std::string_view name, std::uint64_t delta) override;
  void RecordDurationMs(std::string_view name, double duration_ms) override;
  void SetGauge(std::string_view name, std::int64_t value) override;

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const staging::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const staging::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics::~Metrics() {
}

inline void Metrics::IncrementCounter(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordDurationMs(std::string_view, double) {
}

inline void Metrics::SetGauge(std::string_view, std::int64_t) {
}
#endif

} // namespace staging::observability
