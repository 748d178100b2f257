#include "catalog/raw_observation_store.h"
#include <algorithm>

std::vector<RawObservation>
IRawObservationStore::history(const std::string &entity,
                              const std::string &key) const {
  auto result = histories(entity, {key});
  auto it = result.find(key);
  if (it == result.end())
    return {};
  return it->second;
}

bool IRawObservationStore::hasPurgedHistory(const std::string &entity,
                                            const std::string &key) const {
  return purgedKeys(entity, {key}).count(key) > 0;
}

void MemoryRawObservationStore::append(
    const std::string &entity,
    const std::vector<RawObservation> &observations) {
  std::lock_guard<std::mutex> lock(mutex_);
  EntityStream &stream = streams_[entity];
  for (const auto &observation : observations) {
    if (observation.payload.is_object()) {
      for (auto it = observation.payload.begin();
           it != observation.payload.end(); ++it) {
        if (std::find(stream.columns.begin(), stream.columns.end(),
                      it.key()) == stream.columns.end())
          stream.columns.push_back(it.key());
      }
    }
    stream.rows.push_back(observation);
  }
}

std::vector<RawObservation>
MemoryRawObservationStore::scanWindow(const std::string &entity,
                                      const TimeWindow &window) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RawObservation> result;
  auto it = streams_.find(entity);
  if (it == streams_.end())
    return result;
  for (const auto &row : it->second.rows) {
    if (window.contains(row.loaded_at))
      result.push_back(row);
  }
  return result;
}

std::map<std::string, std::vector<RawObservation>>
MemoryRawObservationStore::histories(
    const std::string &entity, const std::vector<std::string> &keys) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::vector<RawObservation>> result;
  auto it = streams_.find(entity);
  if (it == streams_.end())
    return result;
  std::set<std::string> wanted(keys.begin(), keys.end());
  for (const auto &row : it->second.rows) {
    if (wanted.count(row.unique_key))
      result[row.unique_key].push_back(row);
  }
  return result;
}

std::set<std::string> MemoryRawObservationStore::purgedKeys(
    const std::string &entity, const std::vector<std::string> &keys) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> result;
  auto it = streams_.find(entity);
  if (it == streams_.end())
    return result;
  for (const auto &key : keys) {
    if (it->second.purged.count(key))
      result.insert(key);
  }
  return result;
}

std::map<std::string, std::set<std::string>>
MemoryRawObservationStore::hashesByKey(
    const std::string &entity, const std::vector<std::string> &keys) const {
  std::map<std::string, std::set<std::string>> result;
  for (const auto &entry : histories(entity, keys)) {
    for (const auto &row : entry.second)
      result[entry.first].insert(row.content_hash);
  }
  return result;
}

std::vector<std::string>
MemoryRawObservationStore::columns(const std::string &entity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(entity);
  if (it == streams_.end())
    return {};
  return it->second.columns;
}

size_t MemoryRawObservationStore::purgeBefore(const std::string &entity,
                                              Timestamp cutoff) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(entity);
  if (it == streams_.end())
    return 0;
  EntityStream &stream = it->second;
  size_t before = stream.rows.size();
  auto kept = std::stable_partition(
      stream.rows.begin(), stream.rows.end(),
      [&](const RawObservation &row) { return row.loaded_at >= cutoff; });
  for (auto removed = kept; removed != stream.rows.end(); ++removed)
    stream.purged.insert(removed->unique_key);
  stream.rows.erase(kept, stream.rows.end());
  return before - stream.rows.size();
}

size_t MemoryRawObservationStore::size(const std::string &entity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(entity);
  return it == streams_.end() ? 0 : it->second.rows.size();
}
