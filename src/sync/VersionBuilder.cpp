#include "sync/VersionBuilder.h"
#include "core/logger.h"
#include <algorithm>
#include <stdexcept>

// Sorts by loaded_at keeping arrival order for ties, counts the ties and
// applies compaction when enabled.
std::vector<RawObservation>
VersionBuilder::prepare(const std::vector<RawObservation> &history,
                        KeyRebuildResult &stats) const {
  std::vector<RawObservation> sorted(history);
  if (!sorted.empty()) {
    stats.unique_key = sorted.front().unique_key;
    for (const auto &observation : sorted) {
      if (observation.unique_key != stats.unique_key) {
        throw std::invalid_argument("History mixes keys '" + stats.unique_key +
                                    "' and '" + observation.unique_key + "'");
      }
    }
  }
  stats.observations = sorted.size();

  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RawObservation &a, const RawObservation &b) {
                     return a.loaded_at < b.loaded_at;
                   });

  for (size_t i = 1; i < sorted.size(); ++i) {
    if (sorted[i].loaded_at == sorted[i - 1].loaded_at)
      ++stats.duplicate_loaded_at;
  }

  if (options_.collapse_unchanged && sorted.size() > 1) {
    std::vector<RawObservation> compacted;
    compacted.reserve(sorted.size());
    for (auto &observation : sorted) {
      if (!compacted.empty() &&
          compacted.back().content_hash == observation.content_hash) {
        ++stats.collapsed;
        continue;
      }
      compacted.push_back(std::move(observation));
    }
    sorted.swap(compacted);
  }
  return sorted;
}

std::vector<VersionedRecord>
VersionBuilder::derive(const std::vector<RawObservation> &sorted) {
  std::vector<VersionedRecord> versions;
  versions.reserve(sorted.size());
  const size_t count = sorted.size();
  for (size_t i = 0; i < count; ++i) {
    const RawObservation &observation = sorted[i];
    const bool last = (i + 1 == count);

    VersionedRecord record;
    record.unique_key = observation.unique_key;
    record.loaded_at = observation.loaded_at;
    record.content_hash = observation.content_hash;
    record.payload = observation.payload;
    record.valid_from =
        i == 0 ? TimeUtils::minTimestamp() : sorted[i - 1].loaded_at;
    record.valid_to = last ? TimeUtils::maxTimestamp() : sorted[i + 1].loaded_at;
    record.updated_at = last ? observation.loaded_at : record.valid_to;
    record.version = static_cast<int64_t>(count - i);
    record.is_current = last;
    versions.push_back(std::move(record));
  }
  return versions;
}

std::vector<VersionedRecord>
VersionBuilder::buildVersions(const std::vector<RawObservation> &history) const {
  KeyRebuildResult stats;
  return derive(prepare(history, stats));
}

std::set<std::string>
VersionBuilder::boundaryHashes(const std::vector<RawObservation> &sortedHistory,
                               const TimeWindow &window) {
  std::set<std::string> hashes;
  const RawObservation *before = nullptr;
  const RawObservation *after = nullptr;
  for (const auto &observation : sortedHistory) {
    if (observation.loaded_at < window.start) {
      before = &observation;
    } else if (window.contains(observation.loaded_at)) {
      hashes.insert(observation.content_hash);
    } else if (!after) {
      after = &observation;
    }
  }
  if (before)
    hashes.insert(before->content_hash);
  if (after)
    hashes.insert(after->content_hash);
  return hashes;
}

KeyRebuildResult VersionBuilder::rebuild(
    const std::vector<RawObservation> &history, const TimeWindow &window,
    bool historyPurged) const {
  KeyRebuildResult result;
  std::vector<RawObservation> sorted = prepare(history, result);
  if (sorted.empty())
    return result;

  if (result.duplicate_loaded_at > 0) {
    Logger::warning(LogCategory::HISTORY, "rebuild",
                    "Key '" + result.unique_key + "' has " +
                        std::to_string(result.duplicate_loaded_at) +
                        " observations sharing a loaded_at; keeping arrival "
                        "order");
  }

  if (historyPurged && sorted.front().loaded_at >= window.start) {
    result.boundary_gap = true;
    Logger::warning(LogCategory::HISTORY, "rebuild",
                    "Key '" + result.unique_key +
                        "' has no retained observation before " +
                        TimeUtils::formatTimestamp(window.start) +
                        "; first version starts at the epoch");
  }

  std::set<std::string> candidates = boundaryHashes(sorted, window);
  for (auto &record : derive(sorted)) {
    if (record.updated_at >= window.end)
      continue;
    if (candidates.count(record.content_hash) &&
        window.contains(record.updated_at))
      result.emitted.push_back(record);
    result.settled.push_back(std::move(record));
  }
  return result;
}
