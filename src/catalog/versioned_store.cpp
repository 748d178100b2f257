#include "catalog/versioned_store.h"
#include <algorithm>

void MemoryVersionedStore::upsertVersions(
    const std::string &entity, const std::vector<VersionedRecord> &records) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &keys = versions_[entity];
  for (const auto &record : records)
    keys[record.unique_key][record.loaded_at] = record;
}

std::vector<VersionedRecord>
MemoryVersionedStore::records(const std::string &entity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<VersionedRecord> result;
  auto it = versions_.find(entity);
  if (it == versions_.end())
    return result;
  for (const auto &key : it->second) {
    for (const auto &entry : key.second)
      result.push_back(entry.second);
  }
  return result;
}

std::vector<VersionedRecord>
MemoryVersionedStore::history(const std::string &entity,
                              const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<VersionedRecord> result;
  auto it = versions_.find(entity);
  if (it == versions_.end())
    return result;
  auto keyIt = it->second.find(key);
  if (keyIt == it->second.end())
    return result;
  for (const auto &entry : keyIt->second)
    result.push_back(entry.second);
  return result;
}

void MemoryVersionedStore::upsertBridgeRows(const std::string &entity,
                                            const std::vector<BridgeRow> &rows) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &stored = bridges_[entity];
  for (const auto &row : rows) {
    for (auto it = stored.begin(); it != stored.end();) {
      if (row.supersedes(it->second))
        it = stored.erase(it);
      else
        ++it;
    }
    stored[row.rowKey()] = row;
  }
}

std::vector<BridgeRow>
MemoryVersionedStore::bridgeRows(const std::string &entity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<BridgeRow> result;
  auto it = bridges_.find(entity);
  if (it == bridges_.end())
    return result;
  for (const auto &entry : it->second)
    result.push_back(entry.second);
  std::sort(result.begin(), result.end(), bridgeRowLess);
  return result;
}

void MemoryVersionedStore::upsertEventRows(const std::string &entity,
                                           const std::vector<EventRow> &rows) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &stored = events_[entity];
  for (const auto &row : rows)
    stored[row.rowKey()] = row;
}

std::vector<EventRow>
MemoryVersionedStore::eventRows(const std::string &entity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<EventRow> result;
  auto it = events_.find(entity);
  if (it == events_.end())
    return result;
  for (const auto &entry : it->second)
    result.push_back(entry.second);
  return result;
}

void MemoryVersionedStore::recordRun(const json &report) {
  std::lock_guard<std::mutex> lock(mutex_);
  runs_.push_back(report);
}

std::vector<json> MemoryVersionedStore::runs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_;
}
