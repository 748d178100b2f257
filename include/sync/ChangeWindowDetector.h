#ifndef CHANGEWINDOWDETECTOR_H
#define CHANGEWINDOWDETECTOR_H

#include "catalog/raw_observation_store.h"
#include <set>
#include <string>
#include <vector>

class ChangeWindowDetector {
  const IRawObservationStore &store_;

public:
  explicit ChangeWindowDetector(const IRawObservationStore &store)
      : store_(store) {}

  // Distinct keys with at least one observation loaded inside the window.
  std::set<std::string> changedKeys(const std::string &entity,
                                    const TimeWindow &window) const;

  static std::set<std::string>
  changedKeys(const std::vector<RawObservation> &observations,
              const TimeWindow &window);
};

#endif
