#ifndef BRIDGERESOLVER_H
#define BRIDGERESOLVER_H

#include "catalog/entity_config_repository.h"
#include "catalog/history_types.h"
#include "sync/HookFrameBuilder.h"
#include <string>
#include <vector>

enum class JoinType { INNER, LEFT };

struct JoinStats {
  size_t matched_pairs = 0;
  size_t non_overlapping = 0;
  size_t unmatched_left = 0;
  size_t malformed = 0;

  void add(const JoinStats &other) {
    matched_pairs += other.matched_pairs;
    non_overlapping += other.non_overlapping;
    unmatched_left += other.unmatched_left;
    malformed += other.malformed;
  }
};

// Joins versioned streams on a shared hook column. A joined row is valid only
// while both sides are: valid_from is the later start, valid_to the earlier
// end, updated_at the later update, and it is current only if both sides are.
class BridgeResolver {
  JoinStats stats_;

public:
  // Bridge row of one hooked record: all its hook columns and its payload
  // columns suffixed with "__<entity>".
  static BridgeRow fromHookedRecord(const EntityConfig &entity,
                                    const HookedRecord &row);

  static bool overlaps(const BridgeRow &left, const BridgeRow &right);

  // Left supplies peripheral and wins on column clashes.
  static BridgeRow intersect(const BridgeRow &left, const BridgeRow &right);

  // Output is sorted with bridgeRowLess. Rows whose `on` column is present but
  // not a well-formed hook are dropped, logged and counted as malformed. With
  // LEFT, a left row without an overlapping match is kept as is, with the
  // right side's hook columns present but empty.
  std::vector<BridgeRow> join(const std::vector<BridgeRow> &left,
                              const std::vector<BridgeRow> &right,
                              const std::string &on,
                              JoinType type = JoinType::INNER);

  const JoinStats &stats() const { return stats_; }
  void resetStats() { stats_ = JoinStats(); }
};

#endif
