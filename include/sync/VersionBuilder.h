#ifndef VERSIONBUILDER_H
#define VERSIONBUILDER_H

#include "catalog/history_types.h"
#include <set>
#include <string>
#include <vector>

struct VersionBuildOptions {
  // Collapse runs of consecutive observations with the same hash into the
  // first one of the run.
  bool collapse_unchanged = false;
};

struct KeyRebuildResult {
  std::string unique_key;
  std::vector<VersionedRecord> emitted;
  // Every version already closed or opened before the window end, emitted
  // rows included. Older rows carry their refreshed version numbers.
  std::vector<VersionedRecord> settled;
  size_t observations = 0;
  size_t duplicate_loaded_at = 0;
  size_t collapsed = 0;
  bool boundary_gap = false;
};

// Reconstructs the validity intervals of one key from its full observation
// history and selects the rows a window has to (re)write.
class VersionBuilder {
public:
  explicit VersionBuilder(VersionBuildOptions options = VersionBuildOptions())
      : options_(options) {}

  // Every version of the key, oldest first. Throws std::invalid_argument when
  // the history mixes keys.
  std::vector<VersionedRecord>
  buildVersions(const std::vector<RawObservation> &history) const;

  // Versions whose hash is in the boundary set and whose updated_at falls in
  // the window, plus the settled versions of the key. historyPurged reports that retention removed older
  // observations of the key.
  KeyRebuildResult rebuild(const std::vector<RawObservation> &history,
                           const TimeWindow &window,
                           bool historyPurged = false) const;

  // Hash of the last observation before the window, of every observation in
  // it and of the first one after it. Expects history sorted by loaded_at.
  static std::set<std::string>
  boundaryHashes(const std::vector<RawObservation> &sortedHistory,
                 const TimeWindow &window);

private:
  VersionBuildOptions options_;

  std::vector<RawObservation> prepare(const std::vector<RawObservation> &history,
                                      KeyRebuildResult &stats) const;
  static std::vector<VersionedRecord>
  derive(const std::vector<RawObservation> &sorted);
};

#endif
