#ifndef HOOKCODEC_H
#define HOOKCODEC_H

#include "utils/time_utils.h"
#include <string>
#include <vector>

struct PrimaryHook {
  std::string namespace_name;
  std::string concept_name;
  std::string qualifier;
  std::string value;

  std::string keyset() const {
    return namespace_name + "." + concept_name + "." + qualifier;
  }

  bool operator==(const PrimaryHook &other) const {
    return namespace_name == other.namespace_name &&
           concept_name == other.concept_name &&
           qualifier == other.qualifier && value == other.value;
  }
};

struct PitHook {
  std::string hook;
  Timestamp valid_from;
};

// Builds and parses hook strings.
//
//   primary    namespace.concept.qualifier|value
//   composite  primary~primary[~primary...]
//   pit        (primary | composite)~epoch__valid_from|YYYY-MM-DD HH:MM:SS.ffffff
//
// Namespace, concept and qualifier are non-empty and free of '.', '|' and
// '~'. The value is non-empty and free of '~'; it may contain '|' and '.'.
// Every compose and parse function throws MalformedHookError when the input
// does not fit the grammar.
class HookCodec {
public:
  static constexpr const char *PIT_MARKER = "~epoch__valid_from|";
  static constexpr char COMPONENT_SEPARATOR = '~';
  static constexpr char VALUE_SEPARATOR = '|';

  static std::string composePrimary(const std::string &namespaceName,
                                    const std::string &conceptName,
                                    const std::string &qualifier,
                                    const std::string &value);
  static std::string composePrimary(const std::string &keyset,
                                    const std::string &value);
  static std::string composeComposite(const std::vector<std::string> &hooks);
  static std::string composePit(const std::string &hook, Timestamp validFrom);

  static PrimaryHook parsePrimary(const std::string &hook);
  static std::vector<std::string> parseComposite(const std::string &hook);
  static PitHook parsePit(const std::string &hook);

  static bool isValidKeyset(const std::string &keyset);

  // Primary or composite hook, not pinned to a point in time.
  static bool isWellFormed(const std::string &hook);
  static bool isWellFormedPit(const std::string &hook);

private:
  static bool isValidSegment(const std::string &segment);
  static bool isValidValue(const std::string &value);
  static void checkPrimaryOrComposite(const std::string &hook);
};

#endif
