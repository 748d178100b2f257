#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include <atomic>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// Run-wide engine settings. Numeric settings are atomics with range-checked
// setters; out of range values throw std::invalid_argument.
struct EngineConfig {
  static std::atomic<size_t> MAX_WORKERS;
  static std::atomic<size_t> HISTORY_BATCH_SIZE;
  static std::atomic<bool> COLLAPSE_UNCHANGED;

  static constexpr size_t DEFAULT_MAX_WORKERS = 4;
  static constexpr size_t DEFAULT_HISTORY_BATCH_SIZE = 500;
  static constexpr bool DEFAULT_COLLAPSE_UNCHANGED = false;

  static constexpr size_t MIN_MAX_WORKERS = 1;
  static constexpr size_t MAX_MAX_WORKERS = 32;
  static constexpr size_t MIN_HISTORY_BATCH_SIZE = 1;
  static constexpr size_t MAX_HISTORY_BATCH_SIZE = 100000;

  static constexpr const char *DEFAULT_METADATA_PREFIX = "_dlt";
  static constexpr const char *DEFAULT_LOAD_ID_COLUMN = "_dlt_load_id";
  static constexpr const char *DEFAULT_ENTITIES_FILE = "entities.json";

  static void setMaxWorkers(size_t v) {
    if (v < MIN_MAX_WORKERS || v > MAX_MAX_WORKERS) {
      throw std::invalid_argument("MAX_WORKERS must be between " +
                                  std::to_string(MIN_MAX_WORKERS) + " and " +
                                  std::to_string(MAX_MAX_WORKERS));
    }
    MAX_WORKERS = v;
  }

  static size_t getMaxWorkers() { return MAX_WORKERS; }

  static void setHistoryBatchSize(size_t v) {
    if (v < MIN_HISTORY_BATCH_SIZE || v > MAX_HISTORY_BATCH_SIZE) {
      throw std::invalid_argument("HISTORY_BATCH_SIZE must be between " +
                                  std::to_string(MIN_HISTORY_BATCH_SIZE) +
                                  " and " +
                                  std::to_string(MAX_HISTORY_BATCH_SIZE));
    }
    HISTORY_BATCH_SIZE = v;
  }

  static size_t getHistoryBatchSize() { return HISTORY_BATCH_SIZE; }

  static void setCollapseUnchanged(bool v) { COLLAPSE_UNCHANGED = v; }
  static bool getCollapseUnchanged() { return COLLAPSE_UNCHANGED; }

  static void setMetadataPrefix(const std::string &prefix);
  static std::string getMetadataPrefix();

  static void setLoadIdColumn(const std::string &column);
  static std::string getLoadIdColumn();

  static void setEntitiesFile(const std::string &path);
  static std::string getEntitiesFile();

  static void setLogFile(const std::string &path);
  static std::string getLogFile();

  // Applies the "engine", "logging" and "entities_file" sections. Keys that
  // are absent keep their current value.
  static void loadFromJson(const json &config);
  static void resetToDefaults();

private:
  static std::mutex stringMutex_;
  static std::string metadataPrefix_;
  static std::string loadIdColumn_;
  static std::string entitiesFile_;
  static std::string logFile_;
};

#endif
