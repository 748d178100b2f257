#include "catalog/postgres_history_store.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <stdexcept>

namespace {

const char *const TIMESTAMP_FORMAT = "'YYYY-MM-DD HH24:MI:SS.US'";

std::string formatted(const std::string &column) {
  return "to_char(" + column + ", " + TIMESTAMP_FORMAT + ")";
}

void requireIdentifier(const std::string &entity) {
  if (!StringUtils::isValidDatabaseIdentifier(entity)) {
    throw std::invalid_argument("Invalid entity name for a table: " + entity);
  }
}

Timestamp timestampAt(const pqxx::row &row, const char *column) {
  return TimeUtils::parseCanonicalTimestamp(row[column].as<std::string>());
}

RawObservation rowToObservation(const pqxx::row &row) {
  RawObservation observation;
  observation.unique_key = row["_unique_key"].as<std::string>();
  observation.loaded_at = timestampAt(row, "_loaded_at");
  observation.content_hash = row["_hash"].as<std::string>();
  observation.payload = json::parse(row["_payload"].as<std::string>());
  return observation;
}

VersionedRecord rowToRecord(const pqxx::row &row) {
  VersionedRecord record;
  record.unique_key = row["_unique_key"].as<std::string>();
  record.loaded_at = timestampAt(row, "_loaded_at");
  record.content_hash = row["_hash"].as<std::string>();
  record.payload = json::parse(row["_payload"].as<std::string>());
  record.valid_from = timestampAt(row, "_valid_from");
  record.valid_to = timestampAt(row, "_valid_to");
  record.updated_at = timestampAt(row, "_updated_at");
  record.version = row["_version"].as<int64_t>();
  record.is_current = row["_is_current"].as<bool>();
  return record;
}

std::string scdSelect(pqxx::work &txn, const std::string &entity) {
  return "SELECT _unique_key, " + formatted("_loaded_at") +
         " AS _loaded_at, _hash, _payload::text AS _payload, " +
         formatted("_valid_from") + " AS _valid_from, " +
         formatted("_valid_to") + " AS _valid_to, " +
         formatted("_updated_at") + " AS _updated_at, _version, _is_current "
         "FROM scd." +
         txn.quote_name(entity);
}

} // namespace

std::string toPostgresTextArray(const std::vector<std::string> &values) {
  std::string literal = "{";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0)
      literal += ',';
    literal += '"';
    for (char c : values[i]) {
      if (c == '"' || c == '\\')
        literal += '\\';
      literal += c;
    }
    literal += '"';
  }
  literal += '}';
  return literal;
}

PostgresRawObservationStore::PostgresRawObservationStore(
    std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

pqxx::connection PostgresRawObservationStore::getConnection() const {
  return pqxx::connection(connectionString_);
}

std::string PostgresRawObservationStore::table(pqxx::work &txn,
                                               const std::string &entity) const {
  requireIdentifier(entity);
  return "raw." + txn.quote_name(entity);
}

void PostgresRawObservationStore::createTables(
    const std::vector<std::string> &entities) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec("CREATE SCHEMA IF NOT EXISTS raw");
    txn.exec("CREATE TABLE IF NOT EXISTS raw.timevault_purged_keys ("
             "entity TEXT NOT NULL, unique_key TEXT NOT NULL, "
             "purged_before TIMESTAMP, PRIMARY KEY (entity, unique_key))");
    for (const auto &entity : entities) {
      std::string name = table(txn, entity);
      txn.exec("CREATE TABLE IF NOT EXISTS " + name +
               " (_seq BIGSERIAL PRIMARY KEY, _unique_key TEXT NOT NULL, "
               "_loaded_at TIMESTAMP NOT NULL, _hash TEXT NOT NULL, "
               "_payload JSONB NOT NULL)");
      txn.exec("CREATE INDEX IF NOT EXISTS " +
               txn.quote_name("idx_" + entity + "_key") + " ON " + name +
               " (_unique_key, _loaded_at)");
      txn.exec("CREATE INDEX IF NOT EXISTS " +
               txn.quote_name("idx_" + entity + "_loaded_at") + " ON " + name +
               " (_loaded_at)");
    }
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresRawObservationStore",
                  "Error creating raw tables: " + std::string(e.what()));
    throw;
  }
}

void PostgresRawObservationStore::append(
    const std::string &entity,
    const std::vector<RawObservation> &observations) {
  if (observations.empty())
    return;
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    const std::string sql = "INSERT INTO " + table(txn, entity) +
                            " (_unique_key, _loaded_at, _hash, _payload) "
                            "VALUES ($1, $2::timestamp, $3, $4::jsonb)";
    for (const auto &observation : observations) {
      txn.exec_params(sql, observation.unique_key,
                      TimeUtils::formatTimestamp(observation.loaded_at),
                      observation.content_hash, observation.payload.dump());
    }
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresRawObservationStore::append",
                  entity + ": " + e.what());
    throw;
  }
}

std::vector<RawObservation>
PostgresRawObservationStore::scanWindow(const std::string &entity,
                                        const TimeWindow &window) const {
  std::vector<RawObservation> observations;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec_params(
      "SELECT _unique_key, " + formatted("_loaded_at") +
          " AS _loaded_at, _hash, _payload::text AS _payload FROM " +
          table(txn, entity) +
          " WHERE _loaded_at >= $1::timestamp AND _loaded_at < $2::timestamp "
          "ORDER BY _seq",
      TimeUtils::formatTimestamp(window.start),
      TimeUtils::formatTimestamp(window.end));
  for (const auto &row : result)
    observations.push_back(rowToObservation(row));
  txn.commit();
  return observations;
}

std::map<std::string, std::vector<RawObservation>>
PostgresRawObservationStore::histories(
    const std::string &entity, const std::vector<std::string> &keys) const {
  std::map<std::string, std::vector<RawObservation>> histories;
  if (keys.empty())
    return histories;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec_params(
      "SELECT _unique_key, " + formatted("_loaded_at") +
          " AS _loaded_at, _hash, _payload::text AS _payload FROM " +
          table(txn, entity) +
          " WHERE _unique_key = ANY($1::text[]) ORDER BY _seq",
      toPostgresTextArray(keys));
  for (const auto &row : result) {
    RawObservation observation = rowToObservation(row);
    histories[observation.unique_key].push_back(std::move(observation));
  }
  txn.commit();
  return histories;
}

std::set<std::string> PostgresRawObservationStore::purgedKeys(
    const std::string &entity, const std::vector<std::string> &keys) const {
  std::set<std::string> purged;
  if (keys.empty())
    return purged;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec_params(
      "SELECT unique_key FROM raw.timevault_purged_keys "
      "WHERE entity = $1 AND unique_key = ANY($2::text[])",
      entity, toPostgresTextArray(keys));
  for (const auto &row : result)
    purged.insert(row[0].as<std::string>());
  txn.commit();
  return purged;
}

std::map<std::string, std::set<std::string>>
PostgresRawObservationStore::hashesByKey(
    const std::string &entity, const std::vector<std::string> &keys) const {
  std::map<std::string, std::set<std::string>> hashes;
  if (keys.empty())
    return hashes;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec_params("SELECT DISTINCT _unique_key, _hash FROM " +
                                    table(txn, entity) +
                                    " WHERE _unique_key = ANY($1::text[])",
                                toPostgresTextArray(keys));
  for (const auto &row : result)
    hashes[row[0].as<std::string>()].insert(row[1].as<std::string>());
  txn.commit();
  return hashes;
}

// Payload keys in the order they first appear.
std::vector<std::string>
PostgresRawObservationStore::columns(const std::string &entity) const {
  std::vector<std::string> columns;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec(
      "SELECT k FROM (SELECT k, MIN(_seq) AS first_seq FROM " +
      table(txn, entity) +
      ", LATERAL jsonb_object_keys(_payload) AS k GROUP BY k) keys "
      "ORDER BY first_seq, k");
  for (const auto &row : result)
    columns.push_back(row[0].as<std::string>());
  txn.commit();
  return columns;
}

PostgresVersionedStore::PostgresVersionedStore(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

pqxx::connection PostgresVersionedStore::getConnection() const {
  return pqxx::connection(connectionString_);
}

void PostgresVersionedStore::createTables(
    const std::vector<std::string> &entities) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec("CREATE SCHEMA IF NOT EXISTS scd");
    txn.exec("CREATE SCHEMA IF NOT EXISTS bridge");
    txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
    txn.exec("CREATE TABLE IF NOT EXISTS metadata.timevault_process_log ("
             "id BIGSERIAL PRIMARY KEY, window_start TIMESTAMP NOT NULL, "
             "window_end TIMESTAMP NOT NULL, status VARCHAR(20) NOT NULL, "
             "report JSONB NOT NULL, created_at TIMESTAMP DEFAULT NOW())");
    for (const auto &entity : entities) {
      requireIdentifier(entity);
      txn.exec("CREATE TABLE IF NOT EXISTS scd." + txn.quote_name(entity) +
               " (_unique_key TEXT NOT NULL, _loaded_at TIMESTAMP NOT NULL, "
               "_hash TEXT NOT NULL, _payload JSONB NOT NULL, "
               "_valid_from TIMESTAMP NOT NULL, _valid_to TIMESTAMP NOT NULL, "
               "_updated_at TIMESTAMP NOT NULL, _version BIGINT NOT NULL, "
               "_is_current BOOLEAN NOT NULL, "
               "PRIMARY KEY (_unique_key, _loaded_at))");
      txn.exec("CREATE TABLE IF NOT EXISTS bridge." + txn.quote_name(entity) +
               " (row_key TEXT PRIMARY KEY, _updated_at TIMESTAMP NOT NULL, "
               "row_data JSONB NOT NULL)");
      txn.exec("CREATE TABLE IF NOT EXISTS bridge." +
               txn.quote_name(entity + "__events") +
               " (row_key TEXT PRIMARY KEY, event TEXT NOT NULL, "
               "event_occurred_on DATE NOT NULL, "
               "_updated_at TIMESTAMP NOT NULL, row_data JSONB NOT NULL)");
    }
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresVersionedStore",
                  "Error creating tables: " + std::string(e.what()));
    throw;
  }
}

// One transaction per batch so a key never shows a half-written history.
void PostgresVersionedStore::upsertVersions(
    const std::string &entity, const std::vector<VersionedRecord> &records) {
  if (records.empty())
    return;
  requireIdentifier(entity);
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    const std::string table = "scd." + txn.quote_name(entity);
    const std::string upsert =
        "INSERT INTO " + table +
        " (_unique_key, _loaded_at, _hash, _payload, _valid_from, _valid_to, "
        "_updated_at, _version, _is_current) VALUES ($1, $2::timestamp, $3, "
        "$4::jsonb, $5::timestamp, $6::timestamp, $7::timestamp, $8, $9) "
        "ON CONFLICT (_unique_key, _loaded_at) DO UPDATE SET "
        "_hash = EXCLUDED._hash, _payload = EXCLUDED._payload, "
        "_valid_from = EXCLUDED._valid_from, _valid_to = EXCLUDED._valid_to, "
        "_updated_at = EXCLUDED._updated_at, _version = EXCLUDED._version, "
        "_is_current = EXCLUDED._is_current";

    for (const auto &record : records) {
      txn.exec_params(upsert, record.unique_key,
                      TimeUtils::formatTimestamp(record.loaded_at),
                      record.content_hash, record.payload.dump(),
                      TimeUtils::formatTimestamp(record.valid_from),
                      TimeUtils::formatTimestamp(record.valid_to),
                      TimeUtils::formatTimestamp(record.updated_at),
                      record.version, record.is_current);
    }

    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "upsertVersions",
                  entity + ": " + e.what());
    throw;
  }
}

std::vector<VersionedRecord>
PostgresVersionedStore::records(const std::string &entity) const {
  requireIdentifier(entity);
  std::vector<VersionedRecord> records;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result =
      txn.exec(scdSelect(txn, entity) + " ORDER BY _unique_key, _loaded_at");
  for (const auto &row : result)
    records.push_back(rowToRecord(row));
  txn.commit();
  return records;
}

std::vector<VersionedRecord>
PostgresVersionedStore::history(const std::string &entity,
                                const std::string &key) const {
  requireIdentifier(entity);
  std::vector<VersionedRecord> records;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec_params(scdSelect(txn, entity) +
                                    " WHERE _unique_key = $1 ORDER BY "
                                    "_loaded_at",
                                key);
  for (const auto &row : result)
    records.push_back(rowToRecord(row));
  txn.commit();
  return records;
}

void PostgresVersionedStore::upsertBridgeRows(
    const std::string &entity, const std::vector<BridgeRow> &rows) {
  if (rows.empty())
    return;
  requireIdentifier(entity);
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    const std::string table = "bridge." + txn.quote_name(entity);

    // Stored rows with an unmatched side whose match has now been found.
    std::vector<std::string> stale;
    auto existing =
        txn.exec("SELECT row_key, row_data::text FROM " + table +
                 " WHERE row_key LIKE '%||' OR row_key LIKE '||%' OR "
                 "row_key LIKE '%||||%' OR row_key = ''");
    for (const auto &stored : existing) {
      BridgeRow storedRow =
          BridgeRow::fromJson(json::parse(stored[1].as<std::string>()));
      for (const auto &row : rows) {
        if (row.supersedes(storedRow)) {
          stale.push_back(stored[0].as<std::string>());
          break;
        }
      }
    }
    if (!stale.empty()) {
      txn.exec_params("DELETE FROM " + table +
                          " WHERE row_key = ANY($1::text[])",
                      toPostgresTextArray(stale));
    }

    const std::string sql =
        "INSERT INTO " + table +
        " (row_key, _updated_at, row_data) VALUES ($1, $2::timestamp, "
        "$3::jsonb) ON CONFLICT (row_key) DO UPDATE SET "
        "_updated_at = EXCLUDED._updated_at, row_data = EXCLUDED.row_data";
    for (const auto &row : rows) {
      txn.exec_params(sql, row.rowKey(),
                      TimeUtils::formatTimestamp(row.updated_at),
                      row.toJson().dump());
    }
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "upsertBridgeRows",
                  entity + ": " + e.what());
    throw;
  }
}

std::vector<BridgeRow>
PostgresVersionedStore::bridgeRows(const std::string &entity) const {
  requireIdentifier(entity);
  std::vector<BridgeRow> rows;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec("SELECT row_data::text FROM bridge." +
                         txn.quote_name(entity) + " ORDER BY row_key");
  for (const auto &row : result)
    rows.push_back(BridgeRow::fromJson(json::parse(row[0].as<std::string>())));
  txn.commit();
  std::sort(rows.begin(), rows.end(), bridgeRowLess);
  return rows;
}

void PostgresVersionedStore::upsertEventRows(const std::string &entity,
                                             const std::vector<EventRow> &rows) {
  if (rows.empty())
    return;
  requireIdentifier(entity);
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    const std::string sql =
        "INSERT INTO bridge." + txn.quote_name(entity + "__events") +
        " (row_key, event, event_occurred_on, _updated_at, row_data) VALUES "
        "($1, $2, $3::date, $4::timestamp, $5::jsonb) ON CONFLICT (row_key) "
        "DO UPDATE SET event_occurred_on = EXCLUDED.event_occurred_on, "
        "_updated_at = EXCLUDED._updated_at, row_data = EXCLUDED.row_data";
    for (const auto &row : rows) {
      txn.exec_params(sql, row.rowKey(), row.event,
                      TimeUtils::formatDate(row.occurred),
                      TimeUtils::formatTimestamp(row.bridge.updated_at),
                      row.toJson().dump());
    }
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "upsertEventRows",
                  entity + ": " + e.what());
    throw;
  }
}

std::vector<EventRow>
PostgresVersionedStore::eventRows(const std::string &entity) const {
  requireIdentifier(entity);
  std::vector<EventRow> rows;
  auto conn = getConnection();
  pqxx::work txn(conn);
  auto result = txn.exec("SELECT row_data::text FROM bridge." +
                         txn.quote_name(entity + "__events") +
                         " ORDER BY row_key");
  for (const auto &row : result)
    rows.push_back(EventRow::fromJson(json::parse(row[0].as<std::string>())));
  txn.commit();
  return rows;
}

void PostgresVersionedStore::recordRun(const json &report) {
  auto conn = getConnection();
  pqxx::work txn(conn);
  txn.exec_params("INSERT INTO metadata.timevault_process_log (window_start, "
                  "window_end, status, report) VALUES ($1::timestamp, "
                  "$2::timestamp, $3, $4::jsonb)",
                  report.value("window_start", std::string()),
                  report.value("window_end", std::string()),
                  report.value("status", std::string("UNKNOWN")),
                  report.dump());
  txn.commit();
}
