#ifndef BRIDGEBUILDER_H
#define BRIDGEBUILDER_H

#include "catalog/entity_config_repository.h"
#include "catalog/versioned_store.h"
#include "sync/BridgeResolver.h"
#include <map>
#include <set>
#include <string>
#include <vector>

struct BridgeEntityStats {
  size_t rows = 0;
  size_t quarantined = 0;
  size_t missing_components = 0;
  size_t malformed_hooks = 0;
  JoinStats joins;
};

// Builds the bridge of an entity: its hook frame left-joined, through every
// foreign hook, with the bridge of the entity that owns that hook. Bridges
// are memoized for the lifetime of the builder, so one builder serves one run.
class BridgeBuilder {
  const EntityConfigRepository &repository_;
  const IVersionedStore &store_;
  std::map<std::string, std::vector<BridgeRow>> cache_;
  std::map<std::string, BridgeEntityStats> stats_;
  std::vector<std::string> inProgress_;

public:
  BridgeBuilder(const EntityConfigRepository &repository,
                const IVersionedStore &store)
      : repository_(repository), store_(store) {}

  // Complete bridge over all stored versions. Throws std::runtime_error on
  // cyclic hook references.
  const std::vector<BridgeRow> &bridge(const std::string &entity);

  // Rows of the bridge whose updated_at falls in the window.
  std::vector<BridgeRow> bridgeForWindow(const std::string &entity,
                                         const TimeWindow &window);

  BridgeEntityStats stats(const std::string &entity) const;
};

#endif
