#ifndef LOGGER_H
#define LOGGER_H

#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  CONFIG = 2,
  STAGING = 3,
  HISTORY = 4,
  HOOKS = 5,
  BRIDGE = 6,
  VALIDATION = 7,
  UNKNOWN = 99
};

class Logger {
private:
  static std::unique_ptr<DatabaseLogWriter> dbWriter_;
  static std::unique_ptr<FileLogWriter> fileWriter_;
  static bool consoleEnabled_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogCategory> categoryMap;
  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message);

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

  static void loadDebugConfigFromDatabase(const std::string &connStr);

public:
  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);
  static LogCategory stringToCategory(const std::string &categoryStr);
  static LogLevel stringToLogLevel(const std::string &levelStr);

  // Opens the configured sinks. connStr enables the metadata.logs writer and
  // lets metadata.config override the level; logFile enables the rotating
  // file sink. Both may be empty.
  static void initialize(const std::string &connStr = "",
                         const std::string &logFile = "");
  static void shutdown();

  // Mirror WARNING and above to stderr. Off by default.
  static void setConsoleEnabled(bool enabled);

  static void debug(LogCategory category, const std::string &message) {
    writeLog(LogLevel::DEBUG, category, "", message);
  }

  static void info(LogCategory category, const std::string &message) {
    writeLog(LogLevel::INFO, category, "", message);
  }

  static void warning(LogCategory category, const std::string &message) {
    writeLog(LogLevel::WARNING, category, "", message);
  }

  static void error(LogCategory category, const std::string &message) {
    writeLog(LogLevel::ERROR, category, "", message);
  }

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
};

#endif
