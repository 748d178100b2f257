#include "core/engine_config.h"
#include "core/logger.h"

std::atomic<size_t> EngineConfig::MAX_WORKERS =
    EngineConfig::DEFAULT_MAX_WORKERS;
std::atomic<size_t> EngineConfig::HISTORY_BATCH_SIZE =
    EngineConfig::DEFAULT_HISTORY_BATCH_SIZE;
std::atomic<bool> EngineConfig::COLLAPSE_UNCHANGED =
    EngineConfig::DEFAULT_COLLAPSE_UNCHANGED;

std::mutex EngineConfig::stringMutex_;
std::string EngineConfig::metadataPrefix_ =
    EngineConfig::DEFAULT_METADATA_PREFIX;
std::string EngineConfig::loadIdColumn_ = EngineConfig::DEFAULT_LOAD_ID_COLUMN;
std::string EngineConfig::entitiesFile_ = EngineConfig::DEFAULT_ENTITIES_FILE;
std::string EngineConfig::logFile_;

void EngineConfig::setMetadataPrefix(const std::string &prefix) {
  if (prefix.empty()) {
    throw std::invalid_argument("metadata_prefix cannot be empty");
  }
  std::lock_guard<std::mutex> lock(stringMutex_);
  metadataPrefix_ = prefix;
}

std::string EngineConfig::getMetadataPrefix() {
  std::lock_guard<std::mutex> lock(stringMutex_);
  return metadataPrefix_;
}

void EngineConfig::setLoadIdColumn(const std::string &column) {
  if (column.empty()) {
    throw std::invalid_argument("load_id_column cannot be empty");
  }
  std::lock_guard<std::mutex> lock(stringMutex_);
  loadIdColumn_ = column;
}

std::string EngineConfig::getLoadIdColumn() {
  std::lock_guard<std::mutex> lock(stringMutex_);
  return loadIdColumn_;
}

void EngineConfig::setEntitiesFile(const std::string &path) {
  std::lock_guard<std::mutex> lock(stringMutex_);
  entitiesFile_ = path;
}

std::string EngineConfig::getEntitiesFile() {
  std::lock_guard<std::mutex> lock(stringMutex_);
  return entitiesFile_;
}

void EngineConfig::setLogFile(const std::string &path) {
  std::lock_guard<std::mutex> lock(stringMutex_);
  logFile_ = path;
}

std::string EngineConfig::getLogFile() {
  std::lock_guard<std::mutex> lock(stringMutex_);
  return logFile_;
}

void EngineConfig::loadFromJson(const json &config) {
  if (config.contains("engine")) {
    const json &engine = config["engine"];
    if (!engine.is_object()) {
      throw std::invalid_argument("'engine' must be an object");
    }
    if (engine.contains("max_workers"))
      setMaxWorkers(engine["max_workers"].get<size_t>());
    if (engine.contains("history_batch_size"))
      setHistoryBatchSize(engine["history_batch_size"].get<size_t>());
    if (engine.contains("collapse_unchanged"))
      setCollapseUnchanged(engine["collapse_unchanged"].get<bool>());
    if (engine.contains("metadata_prefix"))
      setMetadataPrefix(engine["metadata_prefix"].get<std::string>());
    if (engine.contains("load_id_column"))
      setLoadIdColumn(engine["load_id_column"].get<std::string>());
  }

  if (config.contains("logging")) {
    const json &logging = config["logging"];
    if (logging.contains("level"))
      Logger::setLogLevel(logging["level"].get<std::string>());
    if (logging.contains("file"))
      setLogFile(logging["file"].get<std::string>());
  }

  if (config.contains("entities_file"))
    setEntitiesFile(config["entities_file"].get<std::string>());
}

void EngineConfig::resetToDefaults() {
  MAX_WORKERS = DEFAULT_MAX_WORKERS;
  HISTORY_BATCH_SIZE = DEFAULT_HISTORY_BATCH_SIZE;
  COLLAPSE_UNCHANGED = DEFAULT_COLLAPSE_UNCHANGED;
  std::lock_guard<std::mutex> lock(stringMutex_);
  metadataPrefix_ = DEFAULT_METADATA_PREFIX;
  loadIdColumn_ = DEFAULT_LOAD_ID_COLUMN;
  entitiesFile_ = DEFAULT_ENTITIES_FILE;
  logFile_.clear();
}
