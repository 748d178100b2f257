#include "sync/RawStager.h"
#include "core/history_errors.h"
#include "core/logger.h"
#include "sync/Fingerprinter.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

json StagingResult::toJson() const {
  return json{{"received", received},
              {"staged", staged},
              {"duplicates", duplicates},
              {"already_stored", already_stored},
              {"quarantined", quarantined}};
}

RawStager::RawStager(const EntityConfig &entity, IRawObservationStore &store,
                     const std::string &metadataPrefix,
                     const std::string &loadIdColumn)
    : entity_(entity), store_(store), metadataPrefix_(metadataPrefix),
      loadIdColumn_(loadIdColumn) {}

// Decimal strings are read digit by digit so that microseconds survive
// without a round trip through double.
Timestamp RawStager::loadIdToTimestamp(const json &loadId) {
  if (loadId.is_number()) {
    return TimeUtils::fromEpochSeconds(loadId.get<double>());
  }
  if (!loadId.is_string()) {
    throw std::invalid_argument("Load id must be a number or a string");
  }
  const std::string text = StringUtils::trim(loadId.get<std::string>());
  size_t dot = text.find('.');
  std::string whole = text.substr(0, dot);
  std::string fraction = dot == std::string::npos ? "" : text.substr(dot + 1);
  auto allDigits = [](const std::string &s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
      return std::isdigit(c) != 0;
    });
  };
  if (whole.empty() || whole.size() > 12 || !allDigits(whole) ||
      !allDigits(fraction)) {
    throw std::invalid_argument("Unreadable load id '" + text + "'");
  }
  int64_t micros = std::stoll(whole) * 1000000;
  if (fraction.size() > 6) {
    bool roundUp = fraction[6] >= '5';
    fraction = fraction.substr(0, 6);
    if (roundUp)
      micros += 1;
  }
  fraction.append(6 - fraction.size(), '0');
  micros += std::stoll(fraction);
  return TimeUtils::fromEpochMicros(micros);
}

RawObservation RawStager::toObservation(const json &row) const {
  if (!row.is_object()) {
    throw std::invalid_argument("Landing row must be an object");
  }
  RawObservation observation;
  observation.unique_key = entity_.uniqueKeyFor(row);

  if (!row.contains(loadIdColumn_) || row[loadIdColumn_].is_null()) {
    throw std::invalid_argument("Landing row has no " + loadIdColumn_);
  }
  observation.loaded_at = loadIdToTimestamp(row[loadIdColumn_]);

  observation.payload = json::object();
  for (auto it = row.begin(); it != row.end(); ++it) {
    if (!StringUtils::startsWith(it.key(), metadataPrefix_))
      observation.payload[it.key()] = it.value();
  }

  if (entity_.attributes.empty()) {
    std::vector<std::string> columns;
    for (auto it = observation.payload.begin(); it != observation.payload.end();
         ++it)
      columns.push_back(it.key());
    observation.content_hash =
        Fingerprinter::fingerprint(observation.payload, columns);
  } else {
    observation.content_hash =
        Fingerprinter::fingerprint(observation.payload, entity_.attributes);
  }
  return observation;
}

StagingResult RawStager::stage(const std::vector<json> &rows) {
  StagingResult result;
  result.received = rows.size();

  // (key, hash) -> earliest observation of the batch
  std::map<std::pair<std::string, std::string>, RawObservation> batch;
  for (size_t i = 0; i < rows.size(); ++i) {
    try {
      RawObservation observation = toObservation(rows[i]);
      auto id = std::make_pair(observation.unique_key, observation.content_hash);
      auto it = batch.find(id);
      if (it == batch.end()) {
        batch.emplace(id, std::move(observation));
      } else {
        result.duplicates++;
        if (observation.loaded_at < it->second.loaded_at)
          it->second = std::move(observation);
      }
    } catch (const MissingHookComponentError &e) {
      result.quarantined++;
      result.issues.push_back("row " + std::to_string(i) + ": " + e.what());
    } catch (const std::invalid_argument &e) {
      result.quarantined++;
      result.issues.push_back("row " + std::to_string(i) + ": " + e.what());
    }
  }

  std::vector<std::string> keys;
  for (const auto &entry : batch) {
    if (keys.empty() || keys.back() != entry.first.first)
      keys.push_back(entry.first.first);
  }
  auto stored = store_.hashesByKey(entity_.name, keys);

  std::vector<RawObservation> fresh;
  for (auto &entry : batch) {
    auto known = stored.find(entry.first.first);
    if (known != stored.end() && known->second.count(entry.first.second)) {
      result.already_stored++;
      continue;
    }
    fresh.push_back(std::move(entry.second));
  }
  std::stable_sort(fresh.begin(), fresh.end(),
                   [](const RawObservation &a, const RawObservation &b) {
                     return a.loaded_at < b.loaded_at;
                   });

  if (!fresh.empty())
    store_.append(entity_.name, fresh);
  result.staged = fresh.size();

  if (result.quarantined > 0) {
    Logger::warning(LogCategory::STAGING, "RawStager",
                    entity_.name + ": quarantined " +
                        std::to_string(result.quarantined) +
                        " landing rows; first: " + result.issues.front());
  }
  Logger::info(LogCategory::STAGING, "RawStager",
               entity_.name + ": received " + std::to_string(result.received) +
                   ", staged " + std::to_string(result.staged) +
                   ", duplicates " + std::to_string(result.duplicates) +
                   ", already stored " +
                   std::to_string(result.already_stored));
  return result;
}
