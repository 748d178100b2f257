#ifndef ENTITY_CONFIG_REPOSITORY_H
#define ENTITY_CONFIG_REPOSITORY_H

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

class IRawObservationStore;

struct HookDefinition {
  std::string name;
  std::string keyset;
  std::string expression;
  bool primary = false;
};

struct CompositeHookDefinition {
  std::string name;
  std::vector<std::string> hooks;
  bool primary = false;
};

struct EventDefinition {
  std::string name;
  std::string expression;
};

struct EntityConfig {
  std::string name;
  std::vector<std::string> key_columns;
  std::vector<std::string> attributes;
  std::vector<HookDefinition> hooks;
  std::vector<CompositeHookDefinition> composite_hooks;
  std::vector<EventDefinition> events;

  // Name of the hook flagged primary, simple or composite. Empty if none.
  std::string primaryHookName() const;
  std::string pitHookName() const { return "_pit" + primaryHookName(); }
  std::string columnSuffix() const { return "__" + name; }

  const HookDefinition *findHook(const std::string &hookName) const;
  const CompositeHookDefinition *
  findCompositeHook(const std::string &hookName) const;

  // Joins the key columns of a landing or payload row with '|'. Throws
  // MissingHookComponentError when a key column is absent or null.
  std::string uniqueKeyFor(const json &row) const;
};

// Loads the entity and hook configuration once at process start and answers
// the cross-entity questions the bridge needs.
class EntityConfigRepository {
public:
  EntityConfigRepository() = default;

  void loadFromFile(const std::string &path);
  void loadFromJson(const json &document);

  const std::vector<EntityConfig> &entities() const { return entities_; }
  const EntityConfig &getEntity(const std::string &name) const;
  bool hasEntity(const std::string &name) const;

  // Fills in the attribute list of entities that did not declare one from the
  // columns the raw store holds, skipping metadata columns.
  void resolveAttributes(const IRawObservationStore &store,
                         const std::string &metadataPrefix);

  // Entity whose primary hook is hookName, if another entity owns it.
  std::optional<std::string> foreignEntityFor(const std::string &hookName) const;

  // Hooks of an entity that are the primary hook of some other entity, simple
  // hooks first then composites, in configuration order.
  std::vector<std::string> foreignHooksOf(const EntityConfig &entity) const;

private:
  std::vector<EntityConfig> entities_;
  std::map<std::string, size_t> index_;

  static EntityConfig parseEntity(const json &item);
  static void validate(const EntityConfig &entity);
};

#endif
