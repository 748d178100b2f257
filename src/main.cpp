#include "catalog/entity_config_repository.h"
#include "catalog/postgres_history_store.h"
#include "core/database_config.h"
#include "core/engine_config.h"
#include "core/logger.h"
#include "sync/HistoryPipeline.h"
#include "sync/RawStager.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_CONFIG_ERROR = 6;

struct CommandLine {
  std::string start;
  std::string end;
  std::string configPath = "config.json";
  bool configExplicit = false;
  std::string asOfOutput;
  std::vector<std::pair<std::string, std::string>> stageFiles;
};

void printUsage() {
  std::cerr << "Usage: timevault --start <ts> --end <ts> [--config <file>]\n"
               "                 [--stage <entity> <landing.json>]...\n"
               "                 [--as-of <output.json>]\n"
               "Timestamps: 'YYYY-MM-DD[ HH:MM:SS[.ffffff]]', window is "
               "[start, end)."
            << std::endl;
}

CommandLine parseCommandLine(int argc, char *argv[]) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](const std::string &flag) {
      if (i + 1 >= argc)
        throw std::invalid_argument(flag + " needs a value");
      return std::string(argv[++i]);
    };
    if (arg == "--start") {
      cli.start = next(arg);
    } else if (arg == "--end") {
      cli.end = next(arg);
    } else if (arg == "--config") {
      cli.configPath = next(arg);
      cli.configExplicit = true;
    } else if (arg == "--as-of") {
      cli.asOfOutput = next(arg);
    } else if (arg == "--stage") {
      std::string entity = next(arg);
      std::string file = next(arg);
      cli.stageFiles.emplace_back(entity, file);
    } else {
      throw std::invalid_argument("Unknown argument: " + arg);
    }
  }
  if (cli.start.empty() || cli.end.empty()) {
    throw std::invalid_argument("--start and --end are required");
  }
  return cli;
}

json readJsonFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open " + path);
  }
  try {
    return json::parse(file);
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("Invalid JSON in " + path + ": " + e.what());
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Logger shutdown failed: " << e.what() << std::endl;
  }
}
} // namespace

int main(int argc, char *argv[]) {
  CommandLine cli;
  EntityConfigRepository repository;
  std::unique_ptr<TimeWindow> window;

  try {
    cli = parseCommandLine(argc, argv);
    window = std::make_unique<TimeWindow>(TimeUtils::parseTimestamp(cli.start),
                                          TimeUtils::parseTimestamp(cli.end));

    json config = json::object();
    std::ifstream configFile(cli.configPath);
    if (configFile.is_open() || cli.configExplicit) {
      configFile.close();
      config = readJsonFile(cli.configPath);
    }
    DatabaseConfig::loadFromJson(config);
    EngineConfig::loadFromJson(config);
    repository.loadFromFile(EngineConfig::getEntitiesFile());
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    printUsage();
    return EXIT_CONFIG_ERROR;
  }

  std::unique_ptr<IRawObservationStore> rawStore;
  std::unique_ptr<IVersionedStore> versionedStore;
  try {
    Logger::setConsoleEnabled(true);
    std::vector<std::string> entityNames;
    for (const auto &entity : repository.entities())
      entityNames.push_back(entity.name);

    if (DatabaseConfig::isConfigured()) {
      std::string connStr = DatabaseConfig::getPostgresConnectionString();
      Logger::initialize(connStr, EngineConfig::getLogFile());
      auto pgRaw = std::make_unique<PostgresRawObservationStore>(connStr);
      auto pgVersioned = std::make_unique<PostgresVersionedStore>(connStr);
      pgRaw->createTables(entityNames);
      pgVersioned->createTables(entityNames);
      rawStore = std::move(pgRaw);
      versionedStore = std::move(pgVersioned);
      Logger::info(LogCategory::SYSTEM, "main",
                   "Using PostgreSQL stores at " +
                       DatabaseConfig::getPostgresConnectionStringForLogging());
    } else {
      Logger::initialize("", EngineConfig::getLogFile());
      rawStore = std::make_unique<MemoryRawObservationStore>();
      versionedStore = std::make_unique<MemoryVersionedStore>();
      Logger::info(LogCategory::SYSTEM, "main",
                   "No database configured; using in-memory stores");
    }
  } catch (const std::exception &e) {
    std::cerr << "Initialization error: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_INIT_ERROR;
  }

  try {
    for (const auto &stage : cli.stageFiles) {
      const EntityConfig &entity = repository.getEntity(stage.first);
      json landing = readJsonFile(stage.second);
      if (!landing.is_array()) {
        throw std::invalid_argument(stage.second +
                                    " must contain an array of rows");
      }
      std::vector<json> rows(landing.begin(), landing.end());
      RawStager stager(entity, *rawStore, EngineConfig::getMetadataPrefix(),
                       EngineConfig::getLoadIdColumn());
      StagingResult staged = stager.stage(rows);
      std::cout << "staged " << entity.name << ": " << staged.toJson().dump()
                << std::endl;
    }

    repository.resolveAttributes(*rawStore, EngineConfig::getMetadataPrefix());

    PipelineOptions options;
    options.max_workers = EngineConfig::getMaxWorkers();
    options.history_batch_size = EngineConfig::getHistoryBatchSize();
    options.versions.collapse_unchanged = EngineConfig::getCollapseUnchanged();

    HistoryPipeline pipeline(repository, *rawStore, *versionedStore, options);
    RunReport report = pipeline.run(*window);
    std::cout << report.toJson().dump(2) << std::endl;

    if (!cli.asOfOutput.empty()) {
      AsOfTable asOf = pipeline.asOf(*window);
      std::ofstream out(cli.asOfOutput);
      if (!out.is_open()) {
        throw std::runtime_error("Cannot write " + cli.asOfOutput);
      }
      out << json{{"columns", asOf.columns}, {"rows", asOf.rows}}.dump(2)
          << std::endl;
    }

    cleanupLogger();
    return report.hasFailures() ? EXIT_EXECUTION_ERROR : EXIT_SUCCESS_CODE;
  } catch (const std::invalid_argument &e) {
    Logger::error(LogCategory::SYSTEM, "main", e.what());
    std::cerr << "Execution error: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_EXECUTION_ERROR;
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main", e.what());
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CRITICAL_ERROR;
  }
}
