#include "catalog/history_types.h"
#include <stdexcept>
#include <tuple>

namespace {

const char *const RECORD_COLUMNS[] = {
    "_unique_key", "_loaded_at", "_hash",    "_valid_from",
    "_valid_to",   "_updated_at", "_version", "_is_current"};

bool isRecordColumn(const std::string &name) {
  for (const char *column : RECORD_COLUMNS) {
    if (name == column)
      return true;
  }
  return false;
}

Timestamp timestampField(const json &row, const char *column) {
  if (!row.contains(column) || !row[column].is_string()) {
    throw std::invalid_argument(std::string("Row is missing column ") +
                                column);
  }
  return TimeUtils::parseTimestamp(row[column].get<std::string>());
}

} // namespace

TimeWindow::TimeWindow(Timestamp start, Timestamp end)
    : start(start), end(end) {
  if (end <= start) {
    throw std::invalid_argument("Window end " + TimeUtils::formatTimestamp(end) +
                                " must be after start " +
                                TimeUtils::formatTimestamp(start));
  }
}

std::string TimeWindow::toString() const {
  return "[" + TimeUtils::formatTimestamp(start) + ", " +
         TimeUtils::formatTimestamp(end) + ")";
}

json VersionedRecord::toJson() const {
  json row = payload.is_object() ? payload : json::object();
  row["_unique_key"] = unique_key;
  row["_loaded_at"] = TimeUtils::formatTimestamp(loaded_at);
  row["_hash"] = content_hash;
  row["_valid_from"] = TimeUtils::formatTimestamp(valid_from);
  row["_valid_to"] = TimeUtils::formatTimestamp(valid_to);
  row["_updated_at"] = TimeUtils::formatTimestamp(updated_at);
  row["_version"] = version;
  row["_is_current"] = is_current;
  return row;
}

VersionedRecord VersionedRecord::fromJson(const json &row) {
  if (!row.is_object()) {
    throw std::invalid_argument("Versioned record row must be an object");
  }
  VersionedRecord record;
  record.unique_key = row.at("_unique_key").get<std::string>();
  record.loaded_at = timestampField(row, "_loaded_at");
  record.content_hash = row.at("_hash").get<std::string>();
  record.valid_from = timestampField(row, "_valid_from");
  record.valid_to = timestampField(row, "_valid_to");
  record.updated_at = timestampField(row, "_updated_at");
  record.version = row.at("_version").get<int64_t>();
  record.is_current = row.at("_is_current").get<bool>();
  for (auto it = row.begin(); it != row.end(); ++it) {
    if (!isRecordColumn(it.key()))
      record.payload[it.key()] = it.value();
  }
  return record;
}

bool VersionedRecord::operator==(const VersionedRecord &other) const {
  return unique_key == other.unique_key && loaded_at == other.loaded_at &&
         content_hash == other.content_hash && payload == other.payload &&
         valid_from == other.valid_from && valid_to == other.valid_to &&
         updated_at == other.updated_at && version == other.version &&
         is_current == other.is_current;
}

bool versionedRecordLess(const VersionedRecord &a, const VersionedRecord &b) {
  return std::tie(a.unique_key, a.loaded_at) <
         std::tie(b.unique_key, b.loaded_at);
}

std::string BridgeRow::rowKey() const {
  std::string key;
  bool first = true;
  for (const auto &hook : hooks) {
    if (hook.first.compare(0, 4, "_pit") != 0)
      continue;
    if (!first)
      key += "||";
    key += hook.second;
    first = false;
  }
  return key;
}

bool BridgeRow::supersedes(const BridgeRow &stale) const {
  if (peripheral != stale.peripheral)
    return false;
  bool filled = false;
  for (const auto &hook : stale.hooks) {
    if (hook.first.compare(0, 4, "_pit") != 0)
      continue;
    auto own = hooks.find(hook.first);
    if (own == hooks.end())
      return false;
    if (hook.second.empty()) {
      if (!own->second.empty())
        filled = true;
    } else if (hook.second != own->second) {
      return false;
    }
  }
  return filled;
}

json BridgeRow::toJson() const {
  json row = json::object();
  row["peripheral"] = peripheral;
  for (const auto &hook : hooks) {
    if (hook.second.empty())
      row[hook.first] = nullptr;
    else
      row[hook.first] = hook.second;
  }
  if (attributes.is_object()) {
    for (auto it = attributes.begin(); it != attributes.end(); ++it)
      row[it.key()] = it.value();
  }
  row["_updated_at"] = TimeUtils::formatTimestamp(updated_at);
  row["_valid_from"] = TimeUtils::formatTimestamp(valid_from);
  row["_valid_to"] = TimeUtils::formatTimestamp(valid_to);
  row["_is_current"] = is_current;
  return row;
}

// Hook columns are recognised by their "_hook" and "_pit" prefixes. Every
// other non-validity column is an attribute.
BridgeRow BridgeRow::fromJson(const json &row) {
  if (!row.is_object()) {
    throw std::invalid_argument("Bridge row must be an object");
  }
  BridgeRow bridge;
  bridge.peripheral = row.at("peripheral").get<std::string>();
  bridge.updated_at = timestampField(row, "_updated_at");
  bridge.valid_from = timestampField(row, "_valid_from");
  bridge.valid_to = timestampField(row, "_valid_to");
  bridge.is_current = row.at("_is_current").get<bool>();
  for (auto it = row.begin(); it != row.end(); ++it) {
    const std::string &column = it.key();
    if (column == "peripheral" || column == "_updated_at" ||
        column == "event" || column == "event_occurred_on" ||
        column == "event_occurred_at" ||
        column == "_valid_from" || column == "_valid_to" ||
        column == "_is_current")
      continue;
    if (column.compare(0, 5, "_hook") == 0 ||
        column.compare(0, 4, "_pit") == 0) {
      bridge.hooks[column] =
          it.value().is_null() ? std::string() : it.value().get<std::string>();
    } else {
      bridge.attributes[column] = it.value();
    }
  }
  return bridge;
}

bool BridgeRow::operator==(const BridgeRow &other) const {
  return peripheral == other.peripheral && hooks == other.hooks &&
         attributes == other.attributes && valid_from == other.valid_from &&
         valid_to == other.valid_to && updated_at == other.updated_at &&
         is_current == other.is_current;
}

bool bridgeRowLess(const BridgeRow &a, const BridgeRow &b) {
  if (a.peripheral != b.peripheral)
    return a.peripheral < b.peripheral;
  if (a.hooks != b.hooks)
    return a.hooks < b.hooks;
  if (a.valid_from != b.valid_from)
    return a.valid_from < b.valid_from;
  if (a.valid_to != b.valid_to)
    return a.valid_to < b.valid_to;
  return a.attributes.dump() < b.attributes.dump();
}

json EventRow::toJson() const {
  json row = bridge.toJson();
  row["event"] = event;
  row["event_occurred_on"] = TimeUtils::formatDate(occurred);
  row["event_occurred_at"] = TimeUtils::formatTimeOfDay(occurred);
  return row;
}

EventRow EventRow::fromJson(const json &row) {
  EventRow eventRow;
  eventRow.bridge = BridgeRow::fromJson(row);
  eventRow.event = row.at("event").get<std::string>();
  eventRow.occurred = TimeUtils::parseTimestamp(
      row.at("event_occurred_on").get<std::string>() + " " +
      row.at("event_occurred_at").get<std::string>());
  return eventRow;
}
