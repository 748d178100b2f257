#ifndef HOOKFRAMEBUILDER_H
#define HOOKFRAMEBUILDER_H

#include "catalog/entity_config_repository.h"
#include "catalog/history_types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct HookedRecord {
  VersionedRecord record;
  std::map<std::string, std::string> hooks;
};

struct HookFrameResult {
  std::vector<HookedRecord> rows;
  size_t quarantined = 0;
  size_t missing_components = 0;
  size_t malformed = 0;
  std::vector<std::string> issues;
};

// Adds the configured hook columns to an entity's versioned records: simple
// hooks, composites in definition order, then the point-in-time hook of the
// primary hook pinned at valid_from.
class HookFrameBuilder {
  const EntityConfig &entity_;

  std::optional<HookedRecord> hookRecord(const VersionedRecord &record,
                                         HookFrameResult &result) const;

public:
  explicit HookFrameBuilder(const EntityConfig &entity) : entity_(entity) {}

  HookFrameResult build(const std::vector<VersionedRecord> &records) const;
};

#endif
