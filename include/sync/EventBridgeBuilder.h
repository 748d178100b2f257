#ifndef EVENTBRIDGEBUILDER_H
#define EVENTBRIDGEBUILDER_H

#include "catalog/entity_config_repository.h"
#include "catalog/history_types.h"
#include <string>
#include <vector>

struct EventBuildStats {
  size_t rows = 0;
  size_t skipped_null = 0;
  size_t skipped_unparseable = 0;
};

struct AsOfTable {
  std::vector<std::string> columns;
  std::vector<json> rows;
};

// Unpivots the event timestamp columns of a bridge into one row per event.
class EventBridgeBuilder {
  const EntityConfig &entity_;

public:
  explicit EventBridgeBuilder(const EntityConfig &entity) : entity_(entity) {}

  bool hasEvents() const { return !entity_.events.empty(); }

  std::vector<EventRow> buildEvents(const std::vector<BridgeRow> &bridge,
                                    EventBuildStats &stats) const;

  // Concatenates event rows of several entities under one column list: the
  // union of their columns without "_hook__" columns, ordered peripheral,
  // "_pit_hook__" columns, validity columns, then the rest by name. Columns a
  // row lacks are null.
  static AsOfTable unionAsOf(const std::vector<EventRow> &events);
};

#endif
