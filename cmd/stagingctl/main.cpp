#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/in_memory_metrics.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using staging::core::CreationRequest;
using staging::model::CleanupPolicyFromString;
using staging::model::PartitionStrategyFromString;

static void Usage() {
  std::cout << "Usage:\n"
            << "  stagingctl <config.yaml> create <execution_id> <transaction_type_id> <schema.json> [expected_records] [ttl_hours]"
               " [partition=auto|NONE|HASH|RANGE_DATE|RANGE_NUMBER|LIST] [cleanup=AUTO_DROP|MANUAL|ARCHIVE_THEN_DROP|KEEP_METADATA]\n"
            << "  stagingctl <config.yaml> retire <table> [reason]\n"
            << "  stagingctl <config.yaml> optimize <table>\n"
            << "  stagingctl <config.yaml> analyze <table>\n"
            << "  stagingctl <config.yaml> metrics <execution_id>\n"
            << "  stagingctl <config.yaml> list\n"
            << "  stagingctl <config.yaml> cleanup\n";
}

static std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static void PrintCounters(const staging::observability::InMemoryMetricsSink& metrics) {
  for (const auto& [name, value] : metrics.Counters()) {
    std::cout << "counter " << name << "=" << value << "\n";
  }
  for (const auto& [name, value] : metrics.Gauges()) {
    std::cout << "gauge " << name << "=" << value << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = staging::config::ConfigLoader::LoadFromYaml(config_path);
    staging::observability::InitializeLogging(config);

    // stagingctl runs one operation in-process; the scheduler is never started.
    auto metrics = std::make_shared<staging::observability::InMemoryMetricsSink>();
    auto app     = staging::factory::Build(config, metrics);
    auto manager = app.manager;

    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      auto schema = ReadFile(argv[5]);
      if (!schema.has_value()) {
        std::cerr << "cannot read schema file: " << argv[5] << "\n";
        return 1;
      }

      CreationRequest request;
      request.execution_id        = argv[3];
      request.transaction_type_id = std::stoll(argv[4]);
      request.schema_json         = *schema;
      if (argc >= 7) request.expected_records = std::stoull(argv[6]);
      if (argc >= 8) request.ttl_hours = static_cast<uint32_t>(std::stoul(argv[7]));
      if (argc >= 9 && std::string(argv[8]) != "auto") {
        auto partition = PartitionStrategyFromString(argv[8]);
        if (!partition.has_value()) {
          std::cerr << "unsupported partition strategy: " << argv[8] << "\n";
          return 1;
        }
        request.partition_override = partition;
      }
      if (argc >= 10) {
        auto policy = CleanupPolicyFromString(argv[9]);
        if (!policy.has_value()) {
          std::cerr << "unsupported cleanup policy: " << argv[9] << "\n";
          return 1;
        }
        request.cleanup_policy = *policy;
      }

      auto definition = manager->Create(request);
      std::cout << "table=" << definition.physical_name << "\n";
      std::cout << "id=" << definition.id << "\n";
      std::cout << "partition=" << staging::model::ToString(definition.partition_strategy) << "\n";
      std::cout << "compression=" << staging::model::ToString(definition.compression_level) << "\n";
      std::cout << "encrypted=" << (definition.encryption_applied ? "true" : "false") << "\n";
      PrintCounters(*metrics);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "retire") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      const std::string reason = argc >= 5 ? argv[4] : "operator request";
      if (!manager->Retire(argv[3], reason)) {
        std::cerr << "not retired: " << argv[3] << "\n";
        return 2;
      }
      std::cout << "retired\n";
      PrintCounters(*metrics);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "optimize") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto report = manager->Optimize(argv[3]);
      for (const auto& recommendation : report.recommendations) {
        std::cout << "recommended=" << staging::model::ToString(recommendation.type) << " priority="
                  << staging::model::ToString(recommendation.priority) << " expected=" << recommendation.expected_improvement << "\n";
      }
      for (const auto& applied : report.applied) {
        std::cout << "applied=" << applied << "\n";
      }
      std::cout << "improvement_percent=" << report.improvement_percent << "\n";
      PrintCounters(*metrics);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "analyze") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto analysis = manager->Analyze(argv[3]);
      if (analysis.HasError()) {
        std::cerr << *analysis.error << "\n";
        return 2;
      }
      std::cout << "samples=" << analysis.stats.sample_count << "\n";
      std::cout << "average_duration_ms=" << analysis.stats.average_duration_ms << "\n";
      std::cout << "total_records=" << analysis.stats.total_records << "\n";
      std::cout << "average_memory_mb=" << analysis.stats.average_memory_mb << "\n";
      std::cout << "memory_percent=" << analysis.utilization.memory_percent << "\n";
      std::cout << "io_percent=" << analysis.utilization.io_percent << "\n";
      for (auto bottleneck : analysis.bottlenecks) {
        std::cout << "bottleneck=" << staging::model::ToString(bottleneck) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "metrics") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto summary = manager->GetMetrics(argv[3]);
      std::cout << "active_resources=" << summary.active_resources << "\n";
      std::cout << "total_records=" << summary.total_records << "\n";
      std::cout << "total_size_mb=" << summary.total_size_mb << "\n";
      std::cout << "average_optimization_score=" << summary.average_optimization_score << "\n";
      std::cout << "total_memory_mb=" << summary.total_memory_mb << "\n";
      std::cout << "average_memory_mb=" << summary.average_memory_mb << "\n";
      std::cout << "total_io_read_mb=" << summary.total_io_read_mb << "\n";
      std::cout << "total_io_write_mb=" << summary.total_io_write_mb << "\n";
      for (const auto& bottleneck : summary.bottlenecks) {
        std::cout << "bottleneck=" << bottleneck << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      for (const auto& definition : manager->ListActive()) {
        std::cout << definition.physical_name << " execution=" << definition.execution_id
                  << " partition=" << staging::model::ToString(definition.partition_strategy) << " ttl_hours=" << definition.ttl_hours
                  << " cleanup=" << staging::model::ToString(definition.cleanup_policy) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cleanup") {
      if (!app.cleanup) {
        std::cerr << "cleanup disabled by configuration\n";
        return 2;
      }
      auto summary = app.cleanup->RunOnce(staging::util::Now());
      std::cout << "expired=" << summary.expired << "\n";
      std::cout << "retired=" << summary.retired << "\n";
      std::cout << "failed=" << summary.failed << "\n";
      PrintCounters(*metrics);
      return summary.completed ? 0 : 2;
    }
  } catch (const staging::util::ValidationError& e) {
    std::cerr << "invalid request: " << e.what() << "\n";
    return 2;
  } catch (const staging::util::CapacityError& e) {
    std::cerr << "capacity: " << e.what() << "\n";
    return 2;
  } catch (const staging::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
