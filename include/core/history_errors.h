#ifndef HISTORY_ERRORS_H
#define HISTORY_ERRORS_H

#include <stdexcept>
#include <string>

// A hook string, or a component about to become one, does not match the hook
// grammar. Carries the offending text for the log.
class MalformedHookError : public std::runtime_error {
  std::string hook_;

public:
  MalformedHookError(const std::string &hook, const std::string &reason)
      : std::runtime_error("Malformed hook '" + hook + "': " + reason),
        hook_(hook) {}

  const std::string &hook() const { return hook_; }
};

// A column needed to compose a key or hook is absent or null.
class MissingHookComponentError : public std::runtime_error {
  std::string hookName_;
  std::string column_;

public:
  MissingHookComponentError(const std::string &hookName,
                            const std::string &column)
      : std::runtime_error("Missing component '" + column + "' for '" +
                           hookName + "'"),
        hookName_(hookName), column_(column) {}

  const std::string &hookName() const { return hookName_; }
  const std::string &column() const { return column_; }
};

#endif
