#ifndef FINGERPRINTER_H
#define FINGERPRINTER_H

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Content hash of an attribute set. Values are rendered to text, joined with
// '|' in attribute order and hashed with SHA-256. Names do not take part, so
// renaming a column keeps stored hashes comparable.
class Fingerprinter {
public:
  static constexpr const char *NULL_TOKEN = "_timevault_null_";

  static std::string
  fingerprint(const std::vector<std::pair<std::string, json>> &attributes);

  // Hashes the given columns of a row. Absent columns hash like null.
  static std::string fingerprint(const json &row,
                                 const std::vector<std::string> &columns);

  // Strings verbatim, null as NULL_TOKEN, everything else as compact JSON.
  static std::string renderValue(const json &value);
};

#endif
