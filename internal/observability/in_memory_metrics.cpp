#include "internal/observability/in_memory_metrics.hpp"

namespace staging::observability {

void InMemoryMetricsSink::IncrementCounter(std::string_view name, std::uint64_t delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = counters_.find(name);
  if (it == counters_.end()) {
    counters_.emplace(std::string(name), delta);
    return;
  }
  it->second += delta;
}

void InMemoryMetricsSink::RecordDurationMs(std::string_view name, double duration_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = durations_.find(name);
  if (it == durations_.end()) {
    it = durations_.emplace(std::string(name), std::vector<double>{}).first;
  }
  it->second.push_back(duration_ms);
}

void InMemoryMetricsSink::SetGauge(std::string_view name, std::int64_t value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = gauges_.find(name);
  if (it == gauges_.end()) {
    gauges_.emplace(std::string(name), value);
    return;
  }
  it->second = value;
}

std::uint64_t InMemoryMetricsSink::Counter(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

std::int64_t InMemoryMetricsSink::Gauge(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = gauges_.find(name);
  return it == gauges_.end() ? 0 : it->second;
}

std::vector<double> InMemoryMetricsSink::Durations(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = durations_.find(name);
  return it == durations_.end() ? std::vector<double>{} : it->second;
}

std::map<std::string, std::uint64_t> InMemoryMetricsSink::Counters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {counters_.begin(), counters_.end()};
}

std::map<std::string, std::int64_t> InMemoryMetricsSink::Gauges() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {gauges_.begin(), gauges_.end()};
}

} // namespace staging::observability
