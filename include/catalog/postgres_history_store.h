#ifndef POSTGRES_HISTORY_STORE_H
#define POSTGRES_HISTORY_STORE_H

#include "catalog/raw_observation_store.h"
#include "catalog/versioned_store.h"
#include <pqxx/pqxx>
#include <string>
#include <vector>

// Raw observations in raw.<entity>: key, load time, hash and the payload as
// JSONB, plus a sequence column that preserves arrival order. Keys whose
// history was cut by retention are listed in raw.timevault_purged_keys.
class PostgresRawObservationStore : public IRawObservationStore {
  std::string connectionString_;

  pqxx::connection getConnection() const;
  std::string table(pqxx::work &txn, const std::string &entity) const;

public:
  explicit PostgresRawObservationStore(std::string connectionString);

  void createTables(const std::vector<std::string> &entities);

  void append(const std::string &entity,
              const std::vector<RawObservation> &observations) override;
  std::vector<RawObservation>
  scanWindow(const std::string &entity,
             const TimeWindow &window) const override;
  std::map<std::string, std::vector<RawObservation>>
  histories(const std::string &entity,
            const std::vector<std::string> &keys) const override;
  std::set<std::string>
  purgedKeys(const std::string &entity,
             const std::vector<std::string> &keys) const override;
  std::map<std::string, std::set<std::string>>
  hashesByKey(const std::string &entity,
              const std::vector<std::string> &keys) const override;
  std::vector<std::string> columns(const std::string &entity) const override;
};

// scd.<entity> keyed by (_unique_key, _loaded_at), bridge.<entity> and
// bridge.<entity>__events keyed by row key, and the run log in
// metadata.timevault_process_log.
class PostgresVersionedStore : public IVersionedStore {
  std::string connectionString_;

  pqxx::connection getConnection() const;

public:
  explicit PostgresVersionedStore(std::string connectionString);

  void createTables(const std::vector<std::string> &entities);

  void upsertVersions(const std::string &entity,
                      const std::vector<VersionedRecord> &records) override;
  std::vector<VersionedRecord>
  records(const std::string &entity) const override;
  std::vector<VersionedRecord> history(const std::string &entity,
                                       const std::string &key) const override;
  void upsertBridgeRows(const std::string &entity,
                        const std::vector<BridgeRow> &rows) override;
  std::vector<BridgeRow> bridgeRows(const std::string &entity) const override;
  void upsertEventRows(const std::string &entity,
                       const std::vector<EventRow> &rows) override;
  std::vector<EventRow> eventRows(const std::string &entity) const override;
  void recordRun(const json &report) override;
};

// Postgres text[] literal for use as a single bound parameter.
std::string toPostgresTextArray(const std::vector<std::string> &values);

#endif
