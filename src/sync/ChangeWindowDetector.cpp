#include "sync/ChangeWindowDetector.h"
#include "core/logger.h"

std::set<std::string>
ChangeWindowDetector::changedKeys(const std::string &entity,
                                  const TimeWindow &window) const {
  std::set<std::string> keys =
      changedKeys(store_.scanWindow(entity, window), window);
  Logger::debug(LogCategory::HISTORY, "changedKeys",
                entity + " " + window.toString() + ": " +
                    std::to_string(keys.size()) + " changed keys");
  return keys;
}

std::set<std::string>
ChangeWindowDetector::changedKeys(const std::vector<RawObservation> &observations,
                                  const TimeWindow &window) {
  std::set<std::string> keys;
  for (const auto &observation : observations) {
    if (window.contains(observation.loaded_at))
      keys.insert(observation.unique_key);
  }
  return keys;
}
