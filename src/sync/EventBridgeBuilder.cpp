#include "sync/EventBridgeBuilder.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <set>
#include <tuple>

namespace {

const char *const VALIDITY_COLUMNS[] = {"_updated_at", "_valid_from",
                                        "_valid_to", "_is_current"};

std::tuple<int, int, std::string> columnRank(const std::string &column) {
  if (column == "peripheral")
    return std::make_tuple(0, 0, column);
  if (StringUtils::startsWith(column, "_pit_hook__"))
    return std::make_tuple(1, 0, column);
  for (int i = 0; i < 4; ++i) {
    if (column == VALIDITY_COLUMNS[i])
      return std::make_tuple(2, i, std::string());
  }
  return std::make_tuple(3, 0, column);
}

} // namespace

std::vector<EventRow>
EventBridgeBuilder::buildEvents(const std::vector<BridgeRow> &bridge,
                                EventBuildStats &stats) const {
  std::vector<EventRow> events;
  const std::string suffix = entity_.columnSuffix();
  for (const auto &row : bridge) {
    for (const auto &event : entity_.events) {
      const std::string column = event.expression + suffix;
      if (!row.attributes.contains(column) || row.attributes[column].is_null()) {
        stats.skipped_null++;
        continue;
      }
      const json &value = row.attributes[column];
      auto occurred = value.is_string()
                          ? TimeUtils::tryParseTimestamp(value.get<std::string>())
                          : std::nullopt;
      if (!occurred) {
        stats.skipped_unparseable++;
        Logger::debug(LogCategory::BRIDGE, "buildEvents",
                      entity_.name + "." + event.expression +
                          " is not a timestamp: " + value.dump());
        continue;
      }
      EventRow eventRow;
      eventRow.bridge = row;
      eventRow.event = event.name;
      eventRow.occurred = *occurred;
      events.push_back(std::move(eventRow));
    }
  }
  stats.rows += events.size();
  return events;
}

AsOfTable EventBridgeBuilder::unionAsOf(const std::vector<EventRow> &events) {
  AsOfTable table;
  std::set<std::string> columns;
  table.rows.reserve(events.size());
  for (const auto &event : events) {
    json row = event.toJson();
    for (auto it = row.begin(); it != row.end(); ++it) {
      if (!StringUtils::startsWith(it.key(), "_hook__"))
        columns.insert(it.key());
    }
    table.rows.push_back(std::move(row));
  }

  table.columns.assign(columns.begin(), columns.end());
  std::sort(table.columns.begin(), table.columns.end(),
            [](const std::string &a, const std::string &b) {
              return columnRank(a) < columnRank(b);
            });

  for (auto &row : table.rows) {
    json aligned = json::object();
    for (const auto &column : table.columns)
      aligned[column] = row.contains(column) ? row[column] : json();
    row = std::move(aligned);
  }
  return table;
}
