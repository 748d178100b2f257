#include "sync/HookFrameBuilder.h"
#include "core/history_errors.h"
#include "core/logger.h"
#include "sync/Fingerprinter.h"
#include "sync/HookCodec.h"

// Returns nullopt when the primary hook cannot be composed. A failing
// non-primary hook is left out together with every composite that uses it.
std::optional<HookedRecord>
HookFrameBuilder::hookRecord(const VersionedRecord &record,
                             HookFrameResult &result) const {
  HookedRecord hooked;
  hooked.record = record;
  const std::string primary = entity_.primaryHookName();
  const std::string context =
      entity_.name + " key '" + record.unique_key + "' @ " +
      TimeUtils::formatTimestamp(record.loaded_at);

  for (const auto &hook : entity_.hooks) {
    try {
      const json &payload = record.payload;
      if (!payload.contains(hook.expression) ||
          payload[hook.expression].is_null()) {
        throw MissingHookComponentError(hook.name, hook.expression);
      }
      hooked.hooks[hook.name] = HookCodec::composePrimary(
          hook.keyset, Fingerprinter::renderValue(payload[hook.expression]));
    } catch (const MissingHookComponentError &e) {
      result.missing_components++;
      result.issues.push_back(context + ": " + e.what());
    } catch (const MalformedHookError &e) {
      result.malformed++;
      result.issues.push_back(context + ": " + e.what());
    }
  }

  for (const auto &composite : entity_.composite_hooks) {
    std::vector<std::string> components;
    bool complete = true;
    for (const auto &component : composite.hooks) {
      auto it = hooked.hooks.find(component);
      if (it == hooked.hooks.end()) {
        complete = false;
        result.issues.push_back(context + ": composite " + composite.name +
                                " skipped, component " + component +
                                " is missing");
        break;
      }
      components.push_back(it->second);
    }
    if (complete)
      hooked.hooks[composite.name] = HookCodec::composeComposite(components);
  }

  auto primaryIt = hooked.hooks.find(primary);
  if (primaryIt == hooked.hooks.end()) {
    return std::nullopt;
  }
  hooked.hooks[entity_.pitHookName()] =
      HookCodec::composePit(primaryIt->second, record.valid_from);
  return hooked;
}

HookFrameResult
HookFrameBuilder::build(const std::vector<VersionedRecord> &records) const {
  HookFrameResult result;
  result.rows.reserve(records.size());
  for (const auto &record : records) {
    auto hooked = hookRecord(record, result);
    if (hooked) {
      result.rows.push_back(std::move(*hooked));
    } else {
      result.quarantined++;
    }
  }

  if (!result.issues.empty()) {
    Logger::warning(LogCategory::HOOKS, "HookFrameBuilder",
                    entity_.name + ": " + std::to_string(result.issues.size()) +
                        " hook issues, " +
                        std::to_string(result.quarantined) +
                        " records quarantined; first: " +
                        result.issues.front());
  }
  return result;
}
