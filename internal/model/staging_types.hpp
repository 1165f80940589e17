#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace staging::model {

enum class PartitionStrategy : std::uint8_t {
  kNone        = 0,
  kHash        = 1,
  kRangeDate   = 2,
  kRangeNumber = 3,
  kList        = 4,
};

enum class CompressionLevel : std::uint8_t {
  kNone     = 0,
  kBasic    = 1,
  kAdvanced = 2,
  kMaximum  = 3,
};

enum class CleanupPolicy : std::uint8_t {
  kAutoDrop        = 0,
  kManual          = 1,
  kArchiveThenDrop = 2,
  kKeepMetadata    = 3,
};

enum class SampleKind : std::uint8_t {
  kTableCreation       = 0,
  kIndexCreation       = 1,
  kDataInsertion       = 2,
  kQueryExecution      = 3,
  kOptimizationApplied = 4,
  kCleanupExecution    = 5,
  kCompressionApplied  = 6,
  kEncryptionApplied   = 7,
  kPartitionAnalysis   = 8,
  kMemoryUtilization   = 9,
  kIoMetrics           = 10,
  kCpuUtilization      = 11,
};

enum class RecommendationType : std::uint8_t {
  kIndexOptimization = 0,
  kPartitioning      = 1,
  kCompression       = 2,
  kMemoryTuning      = 3,
  kArchival          = 4,
};

enum class RecommendationPriority : std::uint8_t {
  kLow      = 0,
  kMedium   = 1,
  kHigh     = 2,
  kCritical = 3,
};

enum class Bottleneck : std::uint8_t {
  kSlowQueries     = 0,
  kHighMemoryUsage = 1,
  kHighErrorRate   = 2,
};

constexpr std::string_view ToString(PartitionStrategy strategy) {
  switch (strategy) {
    case PartitionStrategy::kHash:
      return "HASH";
    case PartitionStrategy::kRangeDate:
      return "RANGE_DATE";
    case PartitionStrategy::kRangeNumber:
      return "RANGE_NUMBER";
    case PartitionStrategy::kList:
      return "LIST";
    case PartitionStrategy::kNone:
    default:
      return "NONE";
  }
}

constexpr std::string_view ToString(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::kBasic:
      return "BASIC";
    case CompressionLevel::kAdvanced:
      return "ADVANCED";
    case CompressionLevel::kMaximum:
      return "MAXIMUM";
    case CompressionLevel::kNone:
    default:
      return "NONE";
  }
}

constexpr std::string_view ToString(CleanupPolicy policy) {
  switch (policy) {
    case CleanupPolicy::kManual:
      return "MANUAL";
    case CleanupPolicy::kArchiveThenDrop:
      return "ARCHIVE_THEN_DROP";
    case CleanupPolicy::kKeepMetadata:
      return "KEEP_METADATA";
    case CleanupPolicy::kAutoDrop:
    default:
      return "AUTO_DROP";
  }
}

constexpr std::string_view ToString(SampleKind kind) {
  switch (kind) {
    case SampleKind::kTableCreation:
      return "TABLE_CREATION";
    case SampleKind::kIndexCreation:
      return "INDEX_CREATION";
    case SampleKind::kDataInsertion:
      return "DATA_INSERTION";
    case SampleKind::kQueryExecution:
      return "QUERY_EXECUTION";
    case SampleKind::kOptimizationApplied:
      return "OPTIMIZATION_APPLIED";
    case SampleKind::kCleanupExecution:
      return "CLEANUP_EXECUTION";
    case SampleKind::kCompressionApplied:
      return "COMPRESSION_APPLIED";
    case SampleKind::kEncryptionApplied:
      return "ENCRYPTION_APPLIED";
    case SampleKind::kPartitionAnalysis:
      return "PARTITION_ANALYSIS";
    case SampleKind::kMemoryUtilization:
      return "MEMORY_UTILIZATION";
    case SampleKind::kIoMetrics:
      return "IO_METRICS";
    case SampleKind::kCpuUtilization:
      return "CPU_UTILIZATION";
  }
  return "QUERY_EXECUTION";
}

constexpr std::string_view ToString(RecommendationType type) {
  switch (type) {
    case RecommendationType::kIndexOptimization:
      return "INDEX_OPTIMIZATION";
    case RecommendationType::kPartitioning:
      return "PARTITIONING";
    case RecommendationType::kCompression:
      return "COMPRESSION";
    case RecommendationType::kMemoryTuning:
      return "MEMORY_TUNING";
    case RecommendationType::kArchival:
      return "ARCHIVAL";
  }
  return "INDEX_OPTIMIZATION";
}

constexpr std::string_view ToString(RecommendationPriority priority) {
  switch (priority) {
    case RecommendationPriority::kMedium:
      return "MEDIUM";
    case RecommendationPriority::kHigh:
      return "HIGH";
    case RecommendationPriority::kCritical:
      return "CRITICAL";
    case RecommendationPriority::kLow:
    default:
      return "LOW";
  }
}

constexpr std::string_view ToString(Bottleneck bottleneck) {
  switch (bottleneck) {
    case Bottleneck::kHighMemoryUsage:
      return "HIGH_MEMORY_USAGE";
    case Bottleneck::kHighErrorRate:
      return "HIGH_ERROR_RATE";
    case Bottleneck::kSlowQueries:
    default:
      return "SLOW_QUERIES";
  }
}

constexpr std::optional<PartitionStrategy> PartitionStrategyFromString(std::string_view text) {
  if (text == "NONE") return PartitionStrategy::kNone;
  if (text == "HASH") return PartitionStrategy::kHash;
  if (text == "RANGE_DATE") return PartitionStrategy::kRangeDate;
  if (text == "RANGE_NUMBER") return PartitionStrategy::kRangeNumber;
  if (text == "LIST") return PartitionStrategy::kList;
  return std::nullopt;
}

constexpr std::optional<CompressionLevel> CompressionLevelFromString(std::string_view text) {
  if (text == "NONE") return CompressionLevel::kNone;
  if (text == "BASIC") return CompressionLevel::kBasic;
  if (text == "ADVANCED") return CompressionLevel::kAdvanced;
  if (text == "MAXIMUM") return CompressionLevel::kMaximum;
  return std::nullopt;
}

constexpr std::optional<CleanupPolicy> CleanupPolicyFromString(std::string_view text) {
  if (text == "AUTO_DROP") return CleanupPolicy::kAutoDrop;
  if (text == "MANUAL") return CleanupPolicy::kManual;
  if (text == "ARCHIVE_THEN_DROP") return CleanupPolicy::kArchiveThenDrop;
  if (text == "KEEP_METADATA") return CleanupPolicy::kKeepMetadata;
  return std::nullopt;
}

constexpr std::optional<SampleKind> SampleKindFromString(std::string_view text) {
  for (std::uint8_t i = 0; i <= static_cast<std::uint8_t>(SampleKind::kCpuUtilization); ++i) {
    const auto kind = static_cast<SampleKind>(i);
    if (ToString(kind) == text) {
      return kind;
    }
  }
  return std::nullopt;
}

// Resources the cleanup scheduler may retire once their TTL elapses.
constexpr bool IsAutoCleanup(CleanupPolicy policy) {
  return policy == CleanupPolicy::kAutoDrop || policy == CleanupPolicy::kArchiveThenDrop;
}

} // namespace staging::model
