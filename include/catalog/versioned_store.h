#ifndef VERSIONED_STORE_H
#define VERSIONED_STORE_H

#include "catalog/history_types.h"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Destination of the derived tables: versioned records, bridges, event rows
// and the run log. Every write is an idempotent upsert.
class IVersionedStore {
public:
  virtual ~IVersionedStore() = default;

  // Upserts by (unique_key, loaded_at). version and is_current are stored as
  // given; the builder derives them from the key's full history.
  virtual void upsertVersions(const std::string &entity,
                              const std::vector<VersionedRecord> &records) = 0;

  // All stored records ordered by (unique_key, loaded_at).
  virtual std::vector<VersionedRecord>
  records(const std::string &entity) const = 0;

  virtual std::vector<VersionedRecord>
  history(const std::string &entity, const std::string &key) const = 0;

  // Upserts by BridgeRow::rowKey(). A stored row whose unmatched right side
  // a new row fills in is removed (BridgeRow::supersedes).
  virtual void upsertBridgeRows(const std::string &entity,
                                const std::vector<BridgeRow> &rows) = 0;
  virtual std::vector<BridgeRow> bridgeRows(const std::string &entity) const = 0;

  // Upserts by EventRow::rowKey().
  virtual void upsertEventRows(const std::string &entity,
                               const std::vector<EventRow> &rows) = 0;
  virtual std::vector<EventRow> eventRows(const std::string &entity) const = 0;

  virtual void recordRun(const json &report) = 0;
};

class MemoryVersionedStore : public IVersionedStore {
public:
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

  std::vector<json> runs() const;

private:
  using KeyHistory = std::map<Timestamp, VersionedRecord>;

  mutable std::mutex mutex_;
  std::map<std::string, std::map<std::string, KeyHistory>> versions_;
  std::map<std::string, std::map<std::string, BridgeRow>> bridges_;
  std::map<std::string, std::map<std::string, EventRow>> events_;
  std::vector<json> runs_;
};

#endif
