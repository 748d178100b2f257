#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// PostgreSQL connection settings for the raw / versioned stores and the
// database log sink. Read from the "database.postgres" section of
// config.json; POSTGRES_* environment variables take precedence.
class DatabaseConfig {
private:
  static std::string postgres_host_;
  static std::string postgres_db_;
  static std::string postgres_user_;
  static std::string postgres_password_;
  static std::string postgres_port_;
  static bool configured_;
  static std::mutex configMutex_;

  static std::string escapeConnectionParam(const std::string &param);
  static void loadFromEnvUnlocked();

public:
  static void loadFromJson(const json &config);
  static void loadFromEnv();
  static void reset();

  static std::string getPostgresHost() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_host_;
  }
  static std::string getPostgresDB() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_db_;
  }
  static std::string getPostgresUser() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_user_;
  }
  static std::string getPostgresPort() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_port_;
  }

  // True once a postgres section or POSTGRES_HOST was seen. Without it the
  // engine runs against in-memory stores.
  static bool isConfigured() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configured_;
  }

  static std::string getPostgresConnectionString();
  static std::string getPostgresConnectionStringForLogging();
};

#endif
