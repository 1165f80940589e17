#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_resource.hpp"

namespace staging::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

} // namespace

struct GaugeSlot {
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> instrument;
  std::mutex                                                          mutex;
  std::int64_t                                                        value = 0;
};

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  std::mutex mutex;
  std::unordered_map<std::string, opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>>> counters;
  std::unordered_map<std::string, opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>>      histograms;
  std::unordered_map<std::string, std::unique_ptr<GaugeSlot>>                                            gauges;
};

bool InitializeMetrics(const staging::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = OtlpConfigFromRuntime(config);
  const auto endpoint    = ResolveOtlpEndpoint(otlp_config, OtlpSignal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                            BuildOtlpResource(otlp_config));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("staging-manager", "0.1.0");
}

Metrics::~Metrics() = default;

void Metrics::IncrementCounter(std::string_view name, std::uint64_t delta) {
  if (!impl_ || !impl_->meter) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto&                       counter = impl_->counters[std::string(name)];
  if (!counter) {
    counter = impl_->meter->CreateUInt64Counter(std::string(name), "Staging resource lifecycle counter", "1");
  }
  counter->Add(delta);
}

void Metrics::RecordDurationMs(std::string_view name, double duration_ms) {
  if (!impl_ || !impl_->meter) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto&                       histogram = impl_->histograms[std::string(name)];
  if (!histogram) {
    histogram = impl_->meter->CreateDoubleHistogram(std::string(name), "Staging operation duration in milliseconds", "ms");
  }
  histogram->Record(duration_ms, opentelemetry::context::Context{});
}

void Metrics::SetGauge(std::string_view name, std::int64_t value) {
  if (!impl_ || !impl_->meter) {
    return;
  }

  GaugeSlot* slot = nullptr;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto&                       entry = impl_->gauges[std::string(name)];
    if (!entry) {
      entry             = std::make_unique<GaugeSlot>();
      entry->instrument = impl_->meter->CreateInt64ObservableGauge(std::string(name), "Staging resource gauge", "1");
      entry->instrument->AddCallback(
          [](metrics_api::ObserverResult result, void* state) {
            auto*                       gauge = static_cast<GaugeSlot*>(state);
            std::lock_guard<std::mutex> gauge_lock(gauge->mutex);
            auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
            int_result->Observe(gauge->value);
          },
          entry.get());
    }
    slot = entry.get();
  }

  std::lock_guard<std::mutex> gauge_lock(slot->mutex);
  slot->value = value;
}

} // namespace staging::observability

#endif
