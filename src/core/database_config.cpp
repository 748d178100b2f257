#include "core/database_config.h"
#include "core/logger.h"
#include <cctype>
#include <cstdlib>
#include <stdexcept>

std::string DatabaseConfig::postgres_host_ = "localhost";
std::string DatabaseConfig::postgres_db_ = "warehouse";
std::string DatabaseConfig::postgres_user_ = "postgres";
std::string DatabaseConfig::postgres_password_ = "";
std::string DatabaseConfig::postgres_port_ = "5432";
bool DatabaseConfig::configured_ = false;
std::mutex DatabaseConfig::configMutex_;

namespace {

bool isValidPort(const std::string &portStr) {
  if (portStr.empty() || portStr.length() > 5)
    return false;
  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  int portNum = std::stoi(portStr);
  return portNum > 0 && portNum <= 65535;
}

std::string readString(const json &obj, const char *key) {
  if (!obj.contains(key) || obj[key].is_null())
    return "";
  if (obj[key].is_string())
    return obj[key].get<std::string>();
  return obj[key].dump();
}

std::string envOrEmpty(const char *name) {
  const char *value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

} // namespace

// libpq keyword/value syntax: values with spaces or quotes must be single
// quoted with backslash escapes.
std::string DatabaseConfig::escapeConnectionParam(const std::string &param) {
  bool needsQuotes = param.empty();
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuotes = true;
      break;
    }
  }
  if (!needsQuotes)
    return param;

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

void DatabaseConfig::loadFromJson(const json &config) {
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (config.contains("database") && config["database"].is_object() &&
        config["database"].contains("postgres")) {
      const json &pg = config["database"]["postgres"];

      std::string host = readString(pg, "host");
      if (!host.empty())
        postgres_host_ = host;
      std::string db = readString(pg, "database");
      if (!db.empty())
        postgres_db_ = db;
      std::string user = readString(pg, "user");
      if (!user.empty())
        postgres_user_ = user;
      if (pg.contains("password"))
        postgres_password_ = readString(pg, "password");

      std::string port = readString(pg, "port");
      if (!port.empty()) {
        if (!isValidPort(port)) {
          throw std::invalid_argument("Invalid database.postgres.port: " +
                                      port);
        }
        postgres_port_ = port;
      }
      configured_ = true;
    }
    loadFromEnvUnlocked();
  }

  if (isConfigured() && getPostgresConnectionString().find("password=''") !=
                            std::string::npos) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "PostgreSQL password is empty; connections may fail");
  }
}

void DatabaseConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

void DatabaseConfig::loadFromEnvUnlocked() {
  std::string host = envOrEmpty("POSTGRES_HOST");
  std::string port = envOrEmpty("POSTGRES_PORT");
  std::string db = envOrEmpty("POSTGRES_DB");
  std::string user = envOrEmpty("POSTGRES_USER");
  const char *password = std::getenv("POSTGRES_PASSWORD");

  if (!host.empty()) {
    postgres_host_ = host;
    configured_ = true;
  }
  if (!port.empty()) {
    if (!isValidPort(port)) {
      throw std::invalid_argument("Invalid POSTGRES_PORT: " + port);
    }
    postgres_port_ = port;
  }
  if (!db.empty())
    postgres_db_ = db;
  if (!user.empty())
    postgres_user_ = user;
  if (password)
    postgres_password_ = password;
}

void DatabaseConfig::reset() {
  std::lock_guard<std::mutex> lock(configMutex_);
  postgres_host_ = "localhost";
  postgres_db_ = "warehouse";
  postgres_user_ = "postgres";
  postgres_password_ = "";
  postgres_port_ = "5432";
  configured_ = false;
}

std::string DatabaseConfig::getPostgresConnectionString() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return "host=" + escapeConnectionParam(postgres_host_) +
         " dbname=" + escapeConnectionParam(postgres_db_) +
         " user=" + escapeConnectionParam(postgres_user_) +
         " password=" + escapeConnectionParam(postgres_password_) +
         " port=" + escapeConnectionParam(postgres_port_);
}

std::string DatabaseConfig::getPostgresConnectionStringForLogging() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return "host=" + escapeConnectionParam(postgres_host_) +
         " dbname=" + escapeConnectionParam(postgres_db_) +
         " user=" + escapeConnectionParam(postgres_user_) +
         " password=*** port=" + escapeConnectionParam(postgres_port_);
}
