#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/table_schema.hpp"
#include "internal/util/time.hpp"

namespace staging::core {

struct ActiveResourceMetadata {
  std::string physical_name;
  // null until loaded from the definition record
  std::shared_ptr<const model::TableSchema> schema;
  model::PartitionStrategy                  partition = model::PartitionStrategy::kNone;
  util::TimePoint                           created_at{};
  std::string                               definition_id;
};

/*
  In-memory index of undropped staging resources keyed by physical name.

  Consistency model:
  - The repository is authoritative; this is a cache of its active rows.
  - LifecycleManager inserts after a definition commit and erases after
    the dropped timestamp commits.
  - Replace() swaps in a full rebuild from the repository.
  All members are safe to call concurrently.
*/
class ActiveResourceIndex {
 public:
  void Insert(ActiveResourceMetadata metadata);
  bool Erase(const std::string& physical_name);

  std::optional<ActiveResourceMetadata> Find(const std::string& physical_name) const;
  bool                                  Contains(const std::string& physical_name) const;
  std::size_t                           Size() const;

  std::vector<ActiveResourceMetadata> Snapshot() const;
  void                                Replace(std::vector<ActiveResourceMetadata> entries);

  // Attaches a lazily decoded schema; false when the entry is gone.
  bool SetSchema(const std::string& physical_name, std::shared_ptr<const model::TableSchema> schema);

 private:
  mutable std::shared_mutex                               mutex_;
  std::unordered_map<std::string, ActiveResourceMetadata> entries_;
};

} // namespace staging::core
