#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace staging::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool IsExpired(const model::ResourceDefinitionRecord& record, uint64_t now_ms) {
  if (!record.IsActive() || record.ttl_hours == 0) {
    return false;
  }
  if (!staging::model::IsAutoCleanup(record.cleanup_policy)) {
    return false;
  }
  const uint64_t expires_at_ms = record.created_at_ms + static_cast<uint64_t>(record.ttl_hours) * 3'600'000ULL;
  return expires_at_ms <= now_ms;
}

void SortByCreation(std::vector<model::ResourceDefinitionRecord>& records) {
  std::sort(records.begin(), records.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.created_at_ms != rhs.created_at_ms) return lhs.created_at_ms < rhs.created_at_ms;
    return lhs.physical_name < rhs.physical_name;
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryRepository::SaveDefinition(Transaction& t, const model::ResourceDefinitionRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();

  for (const auto& [id, existing] : s.definitions) {
    if (id != r.id && existing.physical_name == r.physical_name) {
      return Result::Err(ErrorCode::AlreadyExists, "physical name already registered: " + r.physical_name);
    }
  }

  auto it = s.definitions.find(r.id);
  if (it == s.definitions.end()) {
    s.definitions.emplace(r.id, r);
  } else {
    auto dropped = it->second.dropped_at_ms;
    it->second   = r;
    if (dropped) it->second.dropped_at_ms = dropped;
  }
  tx.MarkDefinitionWritten(r.id);
  return Result::Ok();
}

std::optional<model::ResourceDefinitionRecord> MemoryRepository::FindDefinitionByName(Transaction& t, const std::string& physical_name) {
  const auto& s = TX(t).View();
  for (const auto& [_, record] : s.definitions) {
    if (record.physical_name == physical_name) return record;
  }
  return std::nullopt;
}

std::vector<model::ResourceDefinitionRecord> MemoryRepository::FindActiveDefinitions(Transaction& t) {
  const auto&                                  s = TX(t).View();
  std::vector<model::ResourceDefinitionRecord> records;
  for (const auto& [_, record] : s.definitions) {
    if (record.IsActive()) records.push_back(record);
  }
  SortByCreation(records);
  return records;
}

std::vector<model::ResourceDefinitionRecord> MemoryRepository::FindActiveDefinitionsByExecution(Transaction& t, const std::string& execution_id) {
  const auto&                                  s = TX(t).View();
  std::vector<model::ResourceDefinitionRecord> records;
  for (const auto& [_, record] : s.definitions) {
    if (record.IsActive() && record.execution_id == execution_id) records.push_back(record);
  }
  SortByCreation(records);
  return records;
}

std::vector<model::ResourceDefinitionRecord> MemoryRepository::FindExpiredDefinitions(Transaction& t, uint64_t now_ms) {
  const auto&                                  s = TX(t).View();
  std::vector<model::ResourceDefinitionRecord> records;
  for (const auto& [_, record] : s.definitions) {
    if (IsExpired(record, now_ms)) records.push_back(record);
  }
  SortByCreation(records);
  return records;
}

Result MemoryRepository::SavePerformanceSample(Transaction& t, model::PerformanceSampleRecord& sample) {
  auto& tx = TX(t);
  if (!tx.View().definitions.contains(sample.definition_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown definition: " + sample.definition_id);
  }
  sample.sample_id                          = tx.NextSampleId();
  tx.Mutable().samples[sample.sample_id] = sample;
  tx.MarkSampleWritten(sample.sample_id);
  return Result::Ok();
}

std::vector<model::PerformanceSampleRecord> MemoryRepository::FindRecentSamples(Transaction& t, const std::string& definition_id, uint64_t since_ms) {
  const auto&                                 s = TX(t).View();
  std::vector<model::PerformanceSampleRecord> samples;
  for (auto it = s.samples.rbegin(); it != s.samples.rend(); ++it) {
    const auto& sample = it->second;
    if (sample.definition_id == definition_id && sample.measured_at_ms >= since_ms) samples.push_back(sample);
  }
  std::stable_sort(samples.begin(), samples.end(), [](const auto& lhs, const auto& rhs) { return lhs.measured_at_ms > rhs.measured_at_ms; });
  return samples;
}

std::vector<model::PerformanceSampleRecord> MemoryRepository::FindSamplesInRange(Transaction& t, const std::string& definition_id, uint64_t start_ms,
                                                                                 uint64_t end_ms) {
  const auto&                                 s = TX(t).View();
  std::vector<model::PerformanceSampleRecord> samples;
  for (auto it = s.samples.rbegin(); it != s.samples.rend(); ++it) {
    const auto& sample = it->second;
    if (sample.definition_id == definition_id && sample.measured_at_ms >= start_ms && sample.measured_at_ms <= end_ms) {
      samples.push_back(sample);
    }
  }
  std::stable_sort(samples.begin(), samples.end(), [](const auto& lhs, const auto& rhs) { return lhs.measured_at_ms > rhs.measured_at_ms; });
  return samples;
}

std::optional<model::PerformanceSampleRecord> MemoryRepository::FindLatestOptimization(Transaction& t, const std::string& definition_id) {
  const auto&                                   s = TX(t).View();
  std::optional<model::PerformanceSampleRecord> latest;
  for (const auto& [_, sample] : s.samples) {
    if (sample.definition_id != definition_id || sample.kind != staging::model::SampleKind::kOptimizationApplied) continue;
    if (!latest || sample.measured_at_ms >= latest->measured_at_ms) latest = sample;
  }
  return latest;
}

} // namespace staging::db::memory
