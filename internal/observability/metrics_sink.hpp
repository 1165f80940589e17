#pragma once

#include <cstdint>
#include <string_view>

namespace staging::observability {

/*
  Metrics collaborator.

  The lifecycle manager owns its gauge values and pushes them here; a sink
  never computes state of its own.
*/
class MetricsSink {
 public:
  virtual ~MetricsSink() = default;

  virtual void IncrementCounter(std::string_view name, std::uint64_t delta) = 0;
  virtual void RecordDurationMs(std::string_view name, double duration_ms)  = 0;
  virtual void SetGauge(std::string_view name, std::int64_t value)          = 0;
};

namespace metric_names {

inline constexpr std::string_view kResourcesCreated     = "staging.resources.created";
inline constexpr std::string_view kResourcesDropped     = "staging.resources.dropped";
inline constexpr std::string_view kOptimizationsApplied = "staging.optimizations.applied";

inline constexpr std::string_view kCreateDurationMs   = "staging.create.duration_ms";
inline constexpr std::string_view kDropDurationMs     = "staging.drop.duration_ms";
inline constexpr std::string_view kOptimizeDurationMs = "staging.optimize.duration_ms";

inline constexpr std::string_view kActiveResources = "staging.resources.active";
inline constexpr std::string_view kActiveMemoryMb  = "staging.resources.active_memory_mb";

} // namespace metric_names

} // namespace staging::observability
