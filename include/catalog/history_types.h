#ifndef HISTORY_TYPES_H
#define HISTORY_TYPES_H

#include "utils/time_utils.h"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

// Half-open processing window [start, end).
struct TimeWindow {
  Timestamp start;
  Timestamp end;

  TimeWindow(Timestamp start, Timestamp end);

  bool contains(Timestamp t) const { return start <= t && t < end; }
  std::string toString() const;
};

// One ingested snapshot of an entity. Immutable once appended.
struct RawObservation {
  std::string unique_key;
  Timestamp loaded_at;
  std::string content_hash;
  json payload = json::object();
};

struct VersionedRecord {
  std::string unique_key;
  Timestamp loaded_at;
  std::string content_hash;
  json payload = json::object();
  Timestamp valid_from;
  Timestamp valid_to;
  Timestamp updated_at;
  int64_t version = 0;
  bool is_current = false;

  // Payload columns followed by _unique_key, _loaded_at, _hash, _valid_from,
  // _valid_to, _updated_at, _version and _is_current.
  json toJson() const;
  static VersionedRecord fromJson(const json &row);

  bool operator==(const VersionedRecord &other) const;
  bool operator!=(const VersionedRecord &other) const {
    return !(*this == other);
  }
};

// Orders records by (unique_key, loaded_at), the order they are stored in.
bool versionedRecordLess(const VersionedRecord &a, const VersionedRecord &b);

struct BridgeRow {
  std::string peripheral;
  std::map<std::string, std::string> hooks;
  json attributes = json::object();
  Timestamp valid_from;
  Timestamp valid_to;
  Timestamp updated_at;
  bool is_current = false;

  // Identity of the row within its bridge: the values of all "_pit" hook
  // columns in column order. Unmatched sides contribute an empty value.
  std::string rowKey() const;

  // True when stale is an unmatched row of the same peripheral that this row
  // completes: every non-empty "_pit" value agrees and at least one empty one
  // is filled in here.
  bool supersedes(const BridgeRow &stale) const;

  json toJson() const;
  static BridgeRow fromJson(const json &row);

  bool operator==(const BridgeRow &other) const;
};

bool bridgeRowLess(const BridgeRow &a, const BridgeRow &b);

struct EventRow {
  BridgeRow bridge;
  std::string event;
  Timestamp occurred;

  std::string rowKey() const { return bridge.rowKey() + "#" + event; }

  // Bridge columns plus event, event_occurred_on (YYYY-MM-DD) and
  // event_occurred_at (HH:MM:SS).
  json toJson() const;
  static EventRow fromJson(const json &row);
};

#endif
