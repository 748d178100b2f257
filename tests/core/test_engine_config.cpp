#include "../test_runner.h"
#include "core/database_config.h"
#include "core/engine_config.h"
#include "core/logger.h"
#include <stdexcept>

int main() {
  TestRunner runner;

  runner.runTest("MAX_WORKERS range", [&]() {
    EngineConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setMaxWorkers(0); }, "0 workers rejected");
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setMaxWorkers(64); }, "64 workers rejected");
    EngineConfig::setMaxWorkers(8);
    runner.assertEquals(static_cast<size_t>(8), EngineConfig::getMaxWorkers(),
                        "8 workers accepted");
  });

  runner.runTest("HISTORY_BATCH_SIZE range", [&]() {
    EngineConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setHistoryBatchSize(0); }, "0 rejected");
    runner.assertThrows<std::invalid_argument>(
        []() { EngineConfig::setHistoryBatchSize(100001); },
        "100001 rejected");
    EngineConfig::setHistoryBatchSize(100000);
    runner.assertEquals(static_cast<size_t>(100000),
                        EngineConfig::getHistoryBatchSize(), "upper bound");
  });

  runner.runTest("Engine and logging sections from JSON", [&]() {
    EngineConfig::resetToDefaults();
    json config = {{"engine",
                    {{"max_workers", 2},
                     {"history_batch_size", 50},
                     {"collapse_unchanged", true},
                     {"metadata_prefix", "_meta"},
                     {"load_id_column", "_meta_load"}}},
                   {"logging", {{"level", "debug"}, {"file", "run.log"}}},
                   {"entities_file", "conf/entities.json"}};
    EngineConfig::loadFromJson(config);
    runner.assertEquals(static_cast<size_t>(2), EngineConfig::getMaxWorkers(),
                        "max_workers");
    runner.assertEquals(static_cast<size_t>(50),
                        EngineConfig::getHistoryBatchSize(),
                        "history_batch_size");
    runner.assertTrue(EngineConfig::getCollapseUnchanged(),
                      "collapse_unchanged");
    runner.assertEquals(std::string("_meta"),
                        EngineConfig::getMetadataPrefix(), "metadata_prefix");
    runner.assertEquals(std::string("_meta_load"),
                        EngineConfig::getLoadIdColumn(), "load_id_column");
    runner.assertEquals(std::string("run.log"), EngineConfig::getLogFile(),
                        "log file");
    runner.assertEquals(std::string("conf/entities.json"),
                        EngineConfig::getEntitiesFile(), "entities_file");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::DEBUG,
                      "log level applied");
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("Out of range values in JSON are rejected", [&]() {
    EngineConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        []() {
          EngineConfig::loadFromJson({{"engine", {{"max_workers", 33}}}});
        },
        "max_workers 33");
    runner.assertEquals(EngineConfig::DEFAULT_MAX_WORKERS,
                        EngineConfig::getMaxWorkers(), "value unchanged");
  });

  runner.runTest("Unknown log level names are ignored", [&]() {
    Logger::setLogLevel(LogLevel::WARNING);
    Logger::setLogLevel("verbose");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::WARNING,
                      "level kept");
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("Database section", [&]() {
    DatabaseConfig::reset();
    runner.assertFalse(DatabaseConfig::isConfigured(),
                       "not configured by default");
    DatabaseConfig::loadFromJson({{"database",
                                   {{"postgres",
                                     {{"host", "db.internal"},
                                      {"port", 5433},
                                      {"database", "dw"},
                                      {"user", "loader"},
                                      {"password", "p w"}}}}}});
    runner.assertTrue(DatabaseConfig::isConfigured(), "configured");
    runner.assertEquals(std::string("5433"), DatabaseConfig::getPostgresPort(),
                        "numeric port read as text");
    std::string conn = DatabaseConfig::getPostgresConnectionString();
    runner.assertTrue(conn.find("password='p w'") != std::string::npos,
                      "password with a space is quoted");
    runner.assertTrue(
        DatabaseConfig::getPostgresConnectionStringForLogging().find("p w") ==
            std::string::npos,
        "password masked for logging");
    runner.assertThrows<std::invalid_argument>(
        []() {
          DatabaseConfig::loadFromJson(
              {{"database", {{"postgres", {{"port", "70000"}}}}}});
        },
        "invalid port");
    DatabaseConfig::reset();
  });

  return runner.printSummary();
}
