#include "catalog/entity_config_repository.h"
#include "catalog/raw_observation_store.h"
#include "core/history_errors.h"
#include "core/logger.h"
#include "sync/HookCodec.h"
#include "utils/string_utils.h"
#include <fstream>
#include <set>
#include <stdexcept>

namespace {

std::vector<std::string> stringList(const json &item, const char *field) {
  std::vector<std::string> values;
  if (!item.contains(field) || item[field].is_null())
    return values;
  if (!item[field].is_array()) {
    throw std::invalid_argument(std::string("'") + field +
                                "' must be an array");
  }
  for (const auto &value : item[field]) {
    values.push_back(value.get<std::string>());
  }
  return values;
}

std::string requiredString(const json &item, const char *field,
                           const std::string &context) {
  if (!item.contains(field) || !item[field].is_string() ||
      item[field].get<std::string>().empty()) {
    throw std::invalid_argument(context + ": '" + field +
                                "' is required and must be a string");
  }
  return item[field].get<std::string>();
}

} // namespace

std::string EntityConfig::primaryHookName() const {
  for (const auto &composite : composite_hooks) {
    if (composite.primary)
      return composite.name;
  }
  for (const auto &hook : hooks) {
    if (hook.primary)
      return hook.name;
  }
  return "";
}

const HookDefinition *
EntityConfig::findHook(const std::string &hookName) const {
  for (const auto &hook : hooks) {
    if (hook.name == hookName)
      return &hook;
  }
  return nullptr;
}

const CompositeHookDefinition *
EntityConfig::findCompositeHook(const std::string &hookName) const {
  for (const auto &composite : composite_hooks) {
    if (composite.name == hookName)
      return &composite;
  }
  return nullptr;
}

std::string EntityConfig::uniqueKeyFor(const json &row) const {
  std::vector<std::string> parts;
  parts.reserve(key_columns.size());
  for (const auto &column : key_columns) {
    if (!row.contains(column) || row[column].is_null()) {
      throw MissingHookComponentError(name + " unique key", column);
    }
    const json &value = row[column];
    parts.push_back(value.is_string() ? value.get<std::string>()
                                      : value.dump());
  }
  return StringUtils::join(parts, "|");
}

void EntityConfigRepository::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open entity configuration file: " + path);
  }
  json document;
  try {
    file >> document;
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("Invalid JSON in " + path + ": " + e.what());
  }
  loadFromJson(document);
  Logger::info(LogCategory::CONFIG, "EntityConfigRepository",
               "Loaded " + std::to_string(entities_.size()) +
                   " entities from " + path);
}

void EntityConfigRepository::loadFromJson(const json &document) {
  if (!document.is_object() || !document.contains("entities") ||
      !document["entities"].is_array()) {
    throw std::invalid_argument(
        "Entity configuration must be an object with an 'entities' array");
  }

  std::vector<EntityConfig> entities;
  std::map<std::string, size_t> index;
  for (const auto &item : document["entities"]) {
    EntityConfig entity = parseEntity(item);
    try {
      validate(entity);
    } catch (const std::invalid_argument &e) {
      Logger::error(LogCategory::VALIDATION, "loadFromJson", e.what());
      throw;
    }
    if (index.count(entity.name)) {
      throw std::invalid_argument("Duplicate entity: " + entity.name);
    }
    index[entity.name] = entities.size();
    entities.push_back(std::move(entity));
  }

  // A primary hook identifies exactly one entity.
  std::map<std::string, std::string> primaryOwners;
  for (const auto &entity : entities) {
    std::string primary = entity.primaryHookName();
    auto inserted = primaryOwners.emplace(primary, entity.name);
    if (!inserted.second) {
      throw std::invalid_argument("Primary hook " + primary +
                                  " is declared by both " +
                                  inserted.first->second + " and " +
                                  entity.name);
    }
  }

  entities_ = std::move(entities);
  index_ = std::move(index);
}

EntityConfig EntityConfigRepository::parseEntity(const json &item) {
  if (!item.is_object()) {
    throw std::invalid_argument("Each entity must be an object");
  }
  EntityConfig entity;
  entity.name = requiredString(item, "name", "entity");
  entity.key_columns = stringList(item, "key_columns");
  entity.attributes = stringList(item, "attributes");

  std::string context = "entity " + entity.name;
  if (item.contains("hooks") && item["hooks"].is_array()) {
    for (const auto &hookJson : item["hooks"]) {
      HookDefinition hook;
      hook.name = requiredString(hookJson, "name", context);
      hook.keyset = requiredString(hookJson, "keyset", context);
      hook.expression = requiredString(hookJson, "expression", context);
      hook.primary = hookJson.value("primary", false);
      entity.hooks.push_back(std::move(hook));
    }
  }
  if (item.contains("composite_hooks") && item["composite_hooks"].is_array()) {
    for (const auto &hookJson : item["composite_hooks"]) {
      CompositeHookDefinition composite;
      composite.name = requiredString(hookJson, "name", context);
      composite.hooks = stringList(hookJson, "hooks");
      composite.primary = hookJson.value("primary", false);
      entity.composite_hooks.push_back(std::move(composite));
    }
  }
  if (item.contains("events") && item["events"].is_array()) {
    for (const auto &eventJson : item["events"]) {
      EventDefinition event;
      event.name = requiredString(eventJson, "name", context);
      event.expression = requiredString(eventJson, "expression", context);
      entity.events.push_back(std::move(event));
    }
  }
  return entity;
}

void EntityConfigRepository::validate(const EntityConfig &entity) {
  const std::string context = "Entity " + entity.name;
  if (!StringUtils::isValidDatabaseIdentifier(entity.name)) {
    throw std::invalid_argument(context + ": name is not a valid identifier");
  }
  if (entity.key_columns.empty()) {
    throw std::invalid_argument(context + ": key_columns cannot be empty");
  }

  std::set<std::string> names;
  size_t primaries = 0;
  for (const auto &hook : entity.hooks) {
    if (!names.insert(hook.name).second) {
      throw std::invalid_argument(context + ": duplicate hook " + hook.name);
    }
    if (!HookCodec::isValidKeyset(hook.keyset)) {
      throw std::invalid_argument(context + ": hook " + hook.name +
                                  " has malformed keyset '" + hook.keyset +
                                  "'");
    }
    if (hook.primary)
      ++primaries;
  }
  for (const auto &composite : entity.composite_hooks) {
    if (!names.insert(composite.name).second) {
      throw std::invalid_argument(context + ": duplicate hook " +
                                  composite.name);
    }
    if (composite.hooks.size() < 2) {
      throw std::invalid_argument(context + ": composite hook " +
                                  composite.name +
                                  " needs at least two components");
    }
    for (const auto &component : composite.hooks) {
      if (!entity.findHook(component)) {
        throw std::invalid_argument(context + ": composite hook " +
                                    composite.name +
                                    " references unknown hook " + component);
      }
    }
    if (composite.primary)
      ++primaries;
  }
  if (primaries != 1) {
    throw std::invalid_argument(context +
                                ": exactly one primary hook is required, found " +
                                std::to_string(primaries));
  }

  std::set<std::string> eventNames;
  for (const auto &event : entity.events) {
    if (!eventNames.insert(event.name).second) {
      throw std::invalid_argument(context + ": duplicate event " + event.name);
    }
  }
}

const EntityConfig &
EntityConfigRepository::getEntity(const std::string &name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    throw std::invalid_argument("Unknown entity: " + name);
  }
  return entities_[it->second];
}

bool EntityConfigRepository::hasEntity(const std::string &name) const {
  return index_.count(name) > 0;
}

void EntityConfigRepository::resolveAttributes(
    const IRawObservationStore &store, const std::string &metadataPrefix) {
  for (auto &entity : entities_) {
    if (!entity.attributes.empty())
      continue;
    for (const auto &column : store.columns(entity.name)) {
      if (!metadataPrefix.empty() &&
          StringUtils::startsWith(column, metadataPrefix))
        continue;
      entity.attributes.push_back(column);
    }
    if (entity.attributes.empty()) {
      Logger::warning(LogCategory::CONFIG, "resolveAttributes",
                      "No attribute columns found for " + entity.name +
                          "; staging will fingerprint every landing column");
    } else {
      Logger::debug(LogCategory::CONFIG, "resolveAttributes",
                    entity.name + ": " +
                        StringUtils::join(entity.attributes, ", "));
    }
  }
}

std::optional<std::string>
EntityConfigRepository::foreignEntityFor(const std::string &hookName) const {
  for (const auto &entity : entities_) {
    if (entity.primaryHookName() == hookName)
      return entity.name;
  }
  return std::nullopt;
}

std::vector<std::string>
EntityConfigRepository::foreignHooksOf(const EntityConfig &entity) const {
  std::vector<std::string> foreign;
  std::string primary = entity.primaryHookName();
  auto consider = [&](const std::string &hookName) {
    if (hookName == primary)
      return;
    auto owner = foreignEntityFor(hookName);
    if (owner && *owner != entity.name)
      foreign.push_back(hookName);
  };
  for (const auto &hook : entity.hooks)
    consider(hook.name);
  for (const auto &composite : entity.composite_hooks)
    consider(composite.name);
  return foreign;
}
