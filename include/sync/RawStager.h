#ifndef RAWSTAGER_H
#define RAWSTAGER_H

#include "catalog/entity_config_repository.h"
#include "catalog/raw_observation_store.h"
#include <string>
#include <vector>

struct StagingResult {
  size_t received = 0;
  size_t staged = 0;
  size_t duplicates = 0;
  size_t already_stored = 0;
  size_t quarantined = 0;
  std::vector<std::string> issues;

  json toJson() const;
};

// Turns landing rows of one entity into raw observations and appends the
// ones whose (key, hash) the store does not hold yet.
class RawStager {
  const EntityConfig &entity_;
  IRawObservationStore &store_;
  std::string metadataPrefix_;
  std::string loadIdColumn_;

public:
  RawStager(const EntityConfig &entity, IRawObservationStore &store,
            const std::string &metadataPrefix, const std::string &loadIdColumn);

  // Throws MissingHookComponentError for a missing key column and
  // std::invalid_argument for a missing or unreadable load id.
  RawObservation toObservation(const json &row) const;

  StagingResult stage(const std::vector<json> &rows);

  // Load ids are seconds since the epoch, as a number or a decimal string.
  static Timestamp loadIdToTimestamp(const json &loadId);
};

#endif
