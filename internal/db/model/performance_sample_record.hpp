#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/staging_types.hpp"

namespace staging::db::model {

/*
  Append-only measurement tied to a resource definition.

  sample_id is assigned by the repository on insert and increases
  monotonically; samples are never updated afterwards.
*/

struct PerformanceSampleRecord {
  uint64_t    sample_id = 0;
  std::string definition_id;
  std::string execution_id;

  staging::model::SampleKind kind           = staging::model::SampleKind::kQueryExecution;
  uint64_t                   measured_at_ms = 0;

  std::optional<double> duration_ms;
  uint64_t              records_processed = 0;
  double                memory_used_mb    = 0.0;
  double                cpu_percent       = 0.0;
  double                io_read_mb        = 0.0;
  double                io_write_mb       = 0.0;

  double table_size_before_mb = 0.0;
  double table_size_after_mb  = 0.0;

  std::string                optimization_applied;
  std::optional<double>      improvement_percent;
  std::optional<std::string> error_message;
  std::string                monitoring_source;
  std::string                note;

  bool IsError() const {
    return error_message.has_value() && !error_message->empty();
  }
};

} // namespace staging::db::model
