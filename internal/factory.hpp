#pragma once

#include <chrono>
#include <memory>

#include "config/config.pb.h"
#include "internal/cleanup/cleanup_scheduler.hpp"
#include "internal/core/lifecycle_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/exec/sql_executor.hpp"
#include "internal/observability/metrics_sink.hpp"
#include "internal/perf/performance_analyzer.hpp"

namespace staging::factory {

/*
  Application

  Owns every long-lived component. The cleanup scheduler is built but
  not started; it is null when cleanup is disabled in config.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<exec::SqlExecutor>          executor;
  std::shared_ptr<observability::MetricsSink> metrics;
  std::shared_ptr<perf::PerformanceAnalyzer>  analyzer;
  std::shared_ptr<core::LifecycleManager>     manager;
  std::shared_ptr<cleanup::CleanupScheduler>  cleanup;
};

/*
  Build

  Composition root. The ONLY place that knows concrete repository and
  executor types. A null metrics sink selects the OpenTelemetry one.
  The active index is rebuilt before returning.
*/
Application Build(const staging::runtime::config::RuntimeConfig& config, std::shared_ptr<observability::MetricsSink> metrics = nullptr);

// Config sections to component policies; zero fields keep the defaults.
core::LifecyclePolicy LifecyclePolicyFromConfig(const staging::runtime::config::RuntimeConfig& config);
core::PartitionPolicy PartitionPolicyFromConfig(const staging::runtime::config::RuntimeConfig& config);
core::SchemaPolicy    SchemaPolicyFromConfig(const staging::runtime::config::RuntimeConfig& config);
perf::AnalyzerPolicy  AnalyzerPolicyFromConfig(const staging::runtime::config::RuntimeConfig& config);
std::chrono::seconds  CleanupIntervalFromConfig(const staging::runtime::config::RuntimeConfig& config);

} // namespace staging::factory
