#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/observability/metrics_sink.hpp"

namespace staging::observability {

/*
  Metrics sink that keeps every value in process.

  Used by stagingctl to print what an operation emitted and by tests to
  assert on counters and gauges.
*/
class InMemoryMetricsSink final : public MetricsSink {
 public:
  void IncrementCounter(std::string_view name, std::uint64_t delta) override;
  void RecordDurationMs(std::string_view name, double duration_ms) override;
  void SetGauge(std::string_view name, std::int64_t value) override;

  std::uint64_t       Counter(std::string_view name) const;
  std::int64_t        Gauge(std::string_view name) const;
  std::vector<double> Durations(std::string_view name) const;

  std::map<std::string, std::uint64_t> Counters() const;
  std::map<std::string, std::int64_t>  Gauges() const;

 private:
  mutable std::mutex                                 mutex_;
  std::map<std::string, std::uint64_t, std::less<>>  counters_;
  std::map<std::string, std::int64_t, std::less<>>   gauges_;
  std::map<std::string, std::vector<double>, std::less<>> durations_;
};

} // namespace staging::observability
