#ifndef HISTORYPIPELINE_H
#define HISTORYPIPELINE_H

#include "catalog/entity_config_repository.h"
#include "catalog/raw_observation_store.h"
#include "catalog/versioned_store.h"
#include "sync/EventBridgeBuilder.h"
#include "sync/VersionBuilder.h"
#include <string>
#include <vector>

struct EntityRunReport {
  std::string entity;
  size_t changed_keys = 0;
  size_t observations_read = 0;
  size_t records_emitted = 0;
  size_t keys_failed = 0;
  size_t boundary_gaps = 0;
  size_t duplicate_loaded_at = 0;
  size_t collapsed = 0;
  size_t bridge_rows = 0;
  size_t event_rows = 0;
  size_t quarantined = 0;
  size_t missing_components = 0;
  size_t malformed_hooks = 0;
  size_t skipped_events = 0;
  std::vector<std::string> errors;

  void add(const EntityRunReport &other);
  json toJson() const;
};

struct RunReport {
  TimeWindow window;
  std::string started_at;
  double duration_ms = 0.0;
  std::vector<EntityRunReport> entities;

  explicit RunReport(const TimeWindow &window) : window(window) {}

  EntityRunReport totals() const;
  bool hasFailures() const;
  json toJson() const;
};

struct PipelineOptions {
  size_t max_workers = 4;
  size_t history_batch_size = 500;
  VersionBuildOptions versions;
};

// Runs one window over every configured entity: versions first, then bridges
// and event rows. Failures are collected in the report; run() itself only
// throws for an invalid window.
class HistoryPipeline {
  const EntityConfigRepository &repository_;
  const IRawObservationStore &rawStore_;
  IVersionedStore &versionedStore_;
  PipelineOptions options_;

  void runBridges(const TimeWindow &window, RunReport &report);

public:
  HistoryPipeline(const EntityConfigRepository &repository,
                  const IRawObservationStore &rawStore,
                  IVersionedStore &versionedStore, PipelineOptions options);

  RunReport run(const TimeWindow &window);

  // Changed keys of one entity, rebuilt batch by batch and upserted.
  EntityRunReport runEntity(const EntityConfig &entity,
                            const TimeWindow &window);

  // Stored event rows of all entities, updated inside the window, as one
  // table.
  AsOfTable asOf(const TimeWindow &window) const;
};

#endif
