#include "core/logger.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <iostream>
#include <sstream>

std::unique_ptr<DatabaseLogWriter> Logger::dbWriter_;
std::unique_ptr<FileLogWriter> Logger::fileWriter_;
bool Logger::consoleEnabled_ = false;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM},   {"DATABASE", LogCategory::DATABASE},
    {"CONFIG", LogCategory::CONFIG},   {"STAGING", LogCategory::STAGING},
    {"HISTORY", LogCategory::HISTORY}, {"HOOKS", LogCategory::HOOKS},
    {"BRIDGE", LogCategory::BRIDGE},   {"VALIDATION", LogCategory::VALIDATION}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

std::string Logger::getLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::getCategoryString(LogCategory category) {
  for (const auto &entry : categoryMap) {
    if (entry.second == category)
      return entry.first;
  }
  return "UNKNOWN";
}

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  auto it = categoryMap.find(StringUtils::toUpper(categoryStr));
  return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
}

LogLevel Logger::stringToLogLevel(const std::string &levelStr) {
  auto it = levelMap.find(StringUtils::toUpper(levelStr));
  return (it != levelMap.end()) ? it->second : LogLevel::INFO;
}

std::string Logger::formatLogMessage(const std::string &timestamp,
                                     const std::string &levelStr,
                                     const std::string &categoryStr,
                                     const std::string &function,
                                     const std::string &message) {
  std::ostringstream oss;
  oss << "[" << timestamp << "] [" << levelStr << "] [" << categoryStr << "]";
  if (!function.empty()) {
    oss << " [" << function << "]";
  }
  oss << " " << message;
  return oss.str();
}

// Filters by the current level, then fans the entry out to every open sink.
// Sinks serialize their own writes, so the global mutex is only held while
// picking them up.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  if (level < getCurrentLogLevel()) {
    return;
  }

  std::string levelStr = getLevelString(level);
  std::string categoryStr = getCategoryString(category);

  DatabaseLogWriter *dbWriter = nullptr;
  FileLogWriter *fileWriter = nullptr;
  bool console = false;
  {
    std::lock_guard<std::mutex> lock(logMutex);
    if (dbWriter_ && dbWriter_->isOpen())
      dbWriter = dbWriter_.get();
    if (fileWriter_ && fileWriter_->isOpen())
      fileWriter = fileWriter_.get();
    console = consoleEnabled_;
  }

  if (dbWriter) {
    dbWriter->writeParsed(levelStr, categoryStr, function, message);
  }

  if (fileWriter || (console && level >= LogLevel::WARNING)) {
    std::string line =
        formatLogMessage(TimeUtils::getCurrentTimestamp(), levelStr,
                         categoryStr, function, message);
    if (fileWriter)
      fileWriter->write(line);
    if (console && level >= LogLevel::WARNING)
      std::cerr << line << std::endl;
  }
}

// Reads debug_level from metadata.config. A missing table or row keeps the
// level already set from config.json.
void Logger::loadDebugConfigFromDatabase(const std::string &connStr) {
  try {
    pqxx::connection conn(connStr);
    pqxx::work txn(conn);
    auto exists = txn.exec("SELECT to_regclass('metadata.config') IS NOT NULL");
    if (exists.empty() || !exists[0][0].as<bool>()) {
      return;
    }
    auto result =
        txn.exec("SELECT value FROM metadata.config WHERE key = 'debug_level'");
    if (!result.empty() && !result[0][0].is_null()) {
      setLogLevel(result[0][0].as<std::string>());
    }
    txn.commit();
  } catch (const std::exception &e) {
    std::cerr << "Logger: could not read metadata.config: " << e.what()
              << std::endl;
  }
}

void Logger::initialize(const std::string &connStr,
                        const std::string &logFile) {
  if (!connStr.empty()) {
    loadDebugConfigFromDatabase(connStr);
  }

  std::lock_guard<std::mutex> lock(logMutex);
  if (!logFile.empty()) {
    fileWriter_ = std::make_unique<FileLogWriter>(logFile);
  }

  if (!connStr.empty()) {
    dbWriter_ = std::make_unique<DatabaseLogWriter>(connStr);
    if (!dbWriter_->isEnabled()) {
      std::cerr << "Warning: Database log writer initialization failed. "
                   "Logging to database will be disabled."
                << std::endl;
    }
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (dbWriter_) {
    dbWriter_->close();
  }
  dbWriter_.reset();
  if (fileWriter_) {
    fileWriter_->close();
  }
  fileWriter_.reset();
}

void Logger::setConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(logMutex);
  consoleEnabled_ = enabled;
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Unknown level names are ignored rather than silently mapped to INFO.
void Logger::setLogLevel(const std::string &levelStr) {
  std::string upper = StringUtils::toUpper(StringUtils::trim(levelStr));
  if (levelMap.find(upper) == levelMap.end()) {
    return;
  }
  setLogLevel(stringToLogLevel(upper));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}
