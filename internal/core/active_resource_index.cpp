#include "internal/core/active_resource_index.hpp"

#include <algorithm>
#include <mutex>

namespace staging::core {

void ActiveResourceIndex::Insert(ActiveResourceMetadata metadata) {
  std::unique_lock lock(mutex_);
  auto             key = metadata.physical_name;
  entries_[key]        = std::move(metadata);
}

bool ActiveResourceIndex::Erase(const std::string& physical_name) {
  std::unique_lock lock(mutex_);
  return entries_.erase(physical_name) > 0;
}

std::optional<ActiveResourceMetadata> ActiveResourceIndex::Find(const std::string& physical_name) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(physical_name);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ActiveResourceIndex::Contains(const std::string& physical_name) const {
  std::shared_lock lock(mutex_);
  return entries_.contains(physical_name);
}

std::size_t ActiveResourceIndex::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::vector<ActiveResourceMetadata> ActiveResourceIndex::Snapshot() const {
  std::vector<ActiveResourceMetadata> out;
  {
    std::shared_lock lock(mutex_);
    out.reserve(entries_.size());
    for (const auto& [_, metadata] : entries_) {
      out.push_back(metadata);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) { return lhs.physical_name < rhs.physical_name; });
  return out;
}

void ActiveResourceIndex::Replace(std::vector<ActiveResourceMetadata> entries) {
  std::unordered_map<std::string, ActiveResourceMetadata> rebuilt;
  rebuilt.reserve(entries.size());
  for (auto& metadata : entries) {
    auto key     = metadata.physical_name;
    rebuilt[key] = std::move(metadata);
  }

  std::unique_lock lock(mutex_);
  entries_.swap(rebuilt);
}

bool ActiveResourceIndex::SetSchema(const std::string& physical_name, std::shared_ptr<const model::TableSchema> schema) {
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(physical_name);
  if (it == entries_.end()) {
    return false;
  }
  it->second.schema = std::move(schema);
  return true;
}

} // namespace staging::core
