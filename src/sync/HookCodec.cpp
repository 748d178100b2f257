#include "sync/HookCodec.h"
#include "core/history_errors.h"
#include "utils/string_utils.h"
#include <stdexcept>

bool HookCodec::isValidSegment(const std::string &segment) {
  return !segment.empty() && segment.find_first_of(".|~") == std::string::npos;
}

bool HookCodec::isValidValue(const std::string &value) {
  return !value.empty() && value.find(COMPONENT_SEPARATOR) == std::string::npos;
}

bool HookCodec::isValidKeyset(const std::string &keyset) {
  std::vector<std::string> parts = StringUtils::split(keyset, '.');
  if (parts.size() != 3)
    return false;
  for (const auto &part : parts) {
    if (!isValidSegment(part))
      return false;
  }
  return true;
}

std::string HookCodec::composePrimary(const std::string &namespaceName,
                                      const std::string &conceptName,
                                      const std::string &qualifier,
                                      const std::string &value) {
  std::string keyset = namespaceName + "." + conceptName + "." + qualifier;
  std::string hook = keyset + VALUE_SEPARATOR + value;
  if (!isValidSegment(namespaceName) || !isValidSegment(conceptName) ||
      !isValidSegment(qualifier)) {
    throw MalformedHookError(hook, "invalid keyset '" + keyset + "'");
  }
  if (!isValidValue(value)) {
    throw MalformedHookError(hook, "value must be non-empty and free of '~'");
  }
  return hook;
}

std::string HookCodec::composePrimary(const std::string &keyset,
                                      const std::string &value) {
  std::vector<std::string> parts = StringUtils::split(keyset, '.');
  if (parts.size() != 3) {
    throw MalformedHookError(keyset + VALUE_SEPARATOR + value,
                             "keyset must be namespace.concept.qualifier");
  }
  return composePrimary(parts[0], parts[1], parts[2], value);
}

// Components are joined in the order given; the caller fixes that order from
// the composite hook definition.
std::string HookCodec::composeComposite(const std::vector<std::string> &hooks) {
  std::string joined = StringUtils::join(hooks, "~");
  if (hooks.size() < 2) {
    throw MalformedHookError(joined,
                             "composite hook needs at least two components");
  }
  for (const auto &component : hooks) {
    parsePrimary(component);
  }
  return joined;
}

std::string HookCodec::composePit(const std::string &hook,
                                  Timestamp validFrom) {
  checkPrimaryOrComposite(hook);
  return hook + PIT_MARKER + TimeUtils::formatTimestamp(validFrom);
}

PrimaryHook HookCodec::parsePrimary(const std::string &hook) {
  size_t bar = hook.find(VALUE_SEPARATOR);
  if (bar == std::string::npos) {
    throw MalformedHookError(hook, "missing '|' between keyset and value");
  }
  std::string keyset = hook.substr(0, bar);
  std::vector<std::string> parts = StringUtils::split(keyset, '.');
  if (parts.size() != 3 || !isValidSegment(parts[0]) ||
      !isValidSegment(parts[1]) || !isValidSegment(parts[2])) {
    throw MalformedHookError(hook, "invalid keyset '" + keyset + "'");
  }
  std::string value = hook.substr(bar + 1);
  if (!isValidValue(value)) {
    throw MalformedHookError(hook, "value must be non-empty and free of '~'");
  }
  return PrimaryHook{parts[0], parts[1], parts[2], value};
}

std::vector<std::string> HookCodec::parseComposite(const std::string &hook) {
  std::vector<std::string> components =
      StringUtils::split(hook, COMPONENT_SEPARATOR);
  if (components.size() < 2) {
    throw MalformedHookError(hook,
                             "composite hook needs at least two components");
  }
  for (const auto &component : components) {
    parsePrimary(component);
  }
  return components;
}

PitHook HookCodec::parsePit(const std::string &hook) {
  const std::string marker = PIT_MARKER;
  size_t pos = hook.rfind(marker);
  if (pos == std::string::npos) {
    throw MalformedHookError(hook, "missing point-in-time suffix");
  }
  PitHook pit;
  pit.hook = hook.substr(0, pos);
  checkPrimaryOrComposite(pit.hook);
  try {
    pit.valid_from =
        TimeUtils::parseCanonicalTimestamp(hook.substr(pos + marker.size()));
  } catch (const std::invalid_argument &e) {
    throw MalformedHookError(hook, e.what());
  }
  return pit;
}

void HookCodec::checkPrimaryOrComposite(const std::string &hook) {
  if (hook.find(COMPONENT_SEPARATOR) == std::string::npos)
    parsePrimary(hook);
  else
    parseComposite(hook);
}

bool HookCodec::isWellFormed(const std::string &hook) {
  try {
    checkPrimaryOrComposite(hook);
    return true;
  } catch (const MalformedHookError &) {
    return false;
  }
}

bool HookCodec::isWellFormedPit(const std::string &hook) {
  try {
    parsePit(hook);
    return true;
  } catch (const MalformedHookError &) {
    return false;
  }
}
