#include "sync/BridgeResolver.h"
#include "core/logger.h"
#include "sync/HookCodec.h"
#include <algorithm>
#include <set>
#include <unordered_map>

namespace {

// Empty string when the row has no value for the column.
const std::string &hookValue(const BridgeRow &row, const std::string &column) {
  static const std::string empty;
  auto it = row.hooks.find(column);
  return it == row.hooks.end() ? empty : it->second;
}

} // namespace

BridgeRow BridgeResolver::fromHookedRecord(const EntityConfig &entity,
                                           const HookedRecord &row) {
  BridgeRow bridge;
  bridge.peripheral = entity.name;
  bridge.hooks = row.hooks;
  const std::string suffix = entity.columnSuffix();
  if (row.record.payload.is_object()) {
    for (auto it = row.record.payload.begin(); it != row.record.payload.end();
         ++it)
      bridge.attributes[it.key() + suffix] = it.value();
  }
  bridge.valid_from = row.record.valid_from;
  bridge.valid_to = row.record.valid_to;
  bridge.updated_at = row.record.updated_at;
  bridge.is_current = row.record.is_current;
  return bridge;
}

bool BridgeResolver::overlaps(const BridgeRow &left, const BridgeRow &right) {
  return left.valid_from < right.valid_to && left.valid_to > right.valid_from;
}

BridgeRow BridgeResolver::intersect(const BridgeRow &left,
                                    const BridgeRow &right) {
  BridgeRow joined = left;
  for (const auto &hook : right.hooks)
    joined.hooks.emplace(hook.first, hook.second);
  if (right.attributes.is_object()) {
    for (auto it = right.attributes.begin(); it != right.attributes.end();
         ++it) {
      if (!joined.attributes.contains(it.key()))
        joined.attributes[it.key()] = it.value();
    }
  }
  joined.valid_from = std::max(left.valid_from, right.valid_from);
  joined.valid_to = std::min(left.valid_to, right.valid_to);
  joined.updated_at = std::max(left.updated_at, right.updated_at);
  joined.is_current = left.is_current && right.is_current;
  return joined;
}

std::vector<BridgeRow> BridgeResolver::join(const std::vector<BridgeRow> &left,
                                            const std::vector<BridgeRow> &right,
                                            const std::string &on,
                                            JoinType type) {
  JoinStats stats;
  std::unordered_map<std::string, std::vector<const BridgeRow *>> index;
  std::set<std::string> rightColumns;
  for (const auto &row : right) {
    for (const auto &hook : row.hooks)
      rightColumns.insert(hook.first);
    const std::string &value = hookValue(row, on);
    if (value.empty())
      continue;
    if (!HookCodec::isWellFormed(value)) {
      stats.malformed++;
      Logger::warning(LogCategory::BRIDGE, "join",
                      "Excluding right row with malformed " + on + " '" +
                          value + "'");
      continue;
    }
    index[value].push_back(&row);
  }

  std::vector<BridgeRow> output;
  for (const auto &row : left) {
    const std::string &value = hookValue(row, on);
    if (!value.empty() && !HookCodec::isWellFormed(value)) {
      stats.malformed++;
      Logger::warning(LogCategory::BRIDGE, "join",
                      "Excluding " + row.peripheral + " row with malformed " +
                          on + " '" + value + "'");
      continue;
    }

    bool matched = false;
    auto it = value.empty() ? index.end() : index.find(value);
    if (it != index.end()) {
      for (const BridgeRow *candidate : it->second) {
        if (!overlaps(row, *candidate)) {
          stats.non_overlapping++;
          continue;
        }
        output.push_back(intersect(row, *candidate));
        stats.matched_pairs++;
        matched = true;
      }
    }

    if (!matched) {
      stats.unmatched_left++;
      if (type == JoinType::LEFT) {
        BridgeRow passthrough = row;
        for (const auto &column : rightColumns)
          passthrough.hooks.emplace(column, std::string());
        output.push_back(std::move(passthrough));
      }
    }
  }

  std::sort(output.begin(), output.end(), bridgeRowLess);
  stats_.add(stats);
  return output;
}
