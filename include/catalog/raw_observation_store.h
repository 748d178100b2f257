#ifndef RAW_OBSERVATION_STORE_H
#define RAW_OBSERVATION_STORE_H

#include "catalog/history_types.h"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Append-only storage of raw observations, one stream per entity.
class IRawObservationStore {
public:
  virtual ~IRawObservationStore() = default;

  virtual void append(const std::string &entity,
                      const std::vector<RawObservation> &observations) = 0;

  // Observations with loaded_at inside the window, in arrival order.
  virtual std::vector<RawObservation>
  scanWindow(const std::string &entity, const TimeWindow &window) const = 0;

  // Full retained history of each requested key, in arrival order. Keys
  // without observations are absent from the result.
  virtual std::map<std::string, std::vector<RawObservation>>
  histories(const std::string &entity,
            const std::vector<std::string> &keys) const = 0;

  // Keys among the requested ones whose older observations were removed by
  // retention.
  virtual std::set<std::string>
  purgedKeys(const std::string &entity,
             const std::vector<std::string> &keys) const = 0;

  virtual std::map<std::string, std::set<std::string>>
  hashesByKey(const std::string &entity,
              const std::vector<std::string> &keys) const = 0;

  // Payload column names in first-seen order.
  virtual std::vector<std::string> columns(const std::string &entity) const = 0;

  std::vector<RawObservation> history(const std::string &entity,
                                      const std::string &key) const;
  bool hasPurgedHistory(const std::string &entity,
                        const std::string &key) const;
};

class MemoryRawObservationStore : public IRawObservationStore {
public:
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

  // Retention: drops observations older than cutoff. Returns the number
  // removed.
  size_t purgeBefore(const std::string &entity, Timestamp cutoff);

  size_t size(const std::string &entity) const;

private:
  struct EntityStream {
    std::vector<RawObservation> rows;
    std::vector<std::string> columns;
    std::set<std::string> purged;
  };

  mutable std::mutex mutex_;
  std::map<std::string, EntityStream> streams_;
};

#endif
