#include "sync/Fingerprinter.h"
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

std::string Fingerprinter::renderValue(const json &value) {
  if (value.is_null())
    return NULL_TOKEN;
  if (value.is_string())
    return value.get<std::string>();
  return value.dump();
}

std::string Fingerprinter::fingerprint(
    const std::vector<std::pair<std::string, json>> &attributes) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256_CTX sha256;
  SHA256_Init(&sha256);
  for (size_t i = 0; i < attributes.size(); ++i) {
    if (i > 0)
      SHA256_Update(&sha256, "|", 1);
    std::string text = renderValue(attributes[i].second);
    SHA256_Update(&sha256, text.c_str(), text.length());
  }
  SHA256_Final(hash, &sha256);

  std::ostringstream oss;
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(hash[i]);
  }
  return oss.str();
}

std::string Fingerprinter::fingerprint(const json &row,
                                       const std::vector<std::string> &columns) {
  std::vector<std::pair<std::string, json>> attributes;
  attributes.reserve(columns.size());
  for (const auto &column : columns) {
    if (row.is_object() && row.contains(column))
      attributes.emplace_back(column, row[column]);
    else
      attributes.emplace_back(column, nullptr);
  }
  return fingerprint(attributes);
}
