#include "sync/BridgeBuilder.h"
#include "core/logger.h"
#include "sync/HookFrameBuilder.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <stdexcept>

const std::vector<BridgeRow> &
BridgeBuilder::bridge(const std::string &entityName) {
  auto cached = cache_.find(entityName);
  if (cached != cache_.end())
    return cached->second;

  if (std::find(inProgress_.begin(), inProgress_.end(), entityName) !=
      inProgress_.end()) {
    inProgress_.push_back(entityName);
    std::string path = StringUtils::join(inProgress_, " -> ");
    inProgress_.clear();
    throw std::runtime_error("Cyclic hook reference: " + path);
  }
  inProgress_.push_back(entityName);

  BridgeEntityStats stats;
  std::vector<BridgeRow> rows;
  try {
    const EntityConfig &entity = repository_.getEntity(entityName);

    HookFrameResult frame =
        HookFrameBuilder(entity).build(store_.records(entityName));
    stats.quarantined = frame.quarantined;
    stats.missing_components = frame.missing_components;
    stats.malformed_hooks = frame.malformed;

    rows.reserve(frame.rows.size());
    for (const auto &hooked : frame.rows)
      rows.push_back(BridgeResolver::fromHookedRecord(entity, hooked));

    BridgeResolver resolver;
    for (const auto &hookName : repository_.foreignHooksOf(entity)) {
      auto foreign = repository_.foreignEntityFor(hookName);
      if (!foreign)
        continue;
      const std::vector<BridgeRow> &right = bridge(*foreign);
      rows = resolver.join(rows, right, hookName, JoinType::LEFT);
    }
    std::sort(rows.begin(), rows.end(), bridgeRowLess);
    stats.joins = resolver.stats();
    stats.malformed_hooks += resolver.stats().malformed;
    stats.rows = rows.size();
  } catch (const std::exception &) {
    // A failed entity must not look like a cycle to the next bridge call.
    auto position =
        std::find(inProgress_.begin(), inProgress_.end(), entityName);
    inProgress_.erase(position, inProgress_.end());
    throw;
  }
  inProgress_.pop_back();
  stats_[entityName] = stats;
  Logger::debug(LogCategory::BRIDGE, "BridgeBuilder",
                entityName + ": " + std::to_string(rows.size()) +
                    " bridge rows, " +
                    std::to_string(stats.joins.matched_pairs) +
                    " matched pairs");
  return cache_.emplace(entityName, std::move(rows)).first->second;
}

std::vector<BridgeRow>
BridgeBuilder::bridgeForWindow(const std::string &entity,
                               const TimeWindow &window) {
  std::vector<BridgeRow> result;
  for (const auto &row : bridge(entity)) {
    if (window.contains(row.updated_at))
      result.push_back(row);
  }
  return result;
}

BridgeEntityStats BridgeBuilder::stats(const std::string &entity) const {
  auto it = stats_.find(entity);
  return it == stats_.end() ? BridgeEntityStats() : it->second;
}
