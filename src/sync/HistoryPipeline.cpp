#include "sync/HistoryPipeline.h"
#include "core/logger.h"
#include "sync/BridgeBuilder.h"
#include "sync/ChangeWindowDetector.h"
#include "sync/KeyProcessorThreadPool.h"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>

void EntityRunReport::add(const EntityRunReport &other) {
  changed_keys += other.changed_keys;
  observations_read += other.observations_read;
  records_emitted += other.records_emitted;
  keys_failed += other.keys_failed;
  boundary_gaps += other.boundary_gaps;
  duplicate_loaded_at += other.duplicate_loaded_at;
  collapsed += other.collapsed;
  bridge_rows += other.bridge_rows;
  event_rows += other.event_rows;
  quarantined += other.quarantined;
  missing_components += other.missing_components;
  malformed_hooks += other.malformed_hooks;
  skipped_events += other.skipped_events;
  errors.insert(errors.end(), other.errors.begin(), other.errors.end());
}

json EntityRunReport::toJson() const {
  return json{{"entity", entity},
              {"changed_keys", changed_keys},
              {"observations_read", observations_read},
              {"records_emitted", records_emitted},
              {"keys_failed", keys_failed},
              {"boundary_gaps", boundary_gaps},
              {"duplicate_loaded_at", duplicate_loaded_at},
              {"collapsed", collapsed},
              {"bridge_rows", bridge_rows},
              {"event_rows", event_rows},
              {"quarantined", quarantined},
              {"missing_components", missing_components},
              {"malformed_hooks", malformed_hooks},
              {"skipped_events", skipped_events},
              {"errors", errors}};
}

EntityRunReport RunReport::totals() const {
  EntityRunReport total;
  total.entity = "*";
  for (const auto &entity : entities)
    total.add(entity);
  return total;
}

bool RunReport::hasFailures() const {
  EntityRunReport total = totals();
  return total.keys_failed > 0 || !total.errors.empty();
}

json RunReport::toJson() const {
  json entityList = json::array();
  for (const auto &entity : entities)
    entityList.push_back(entity.toJson());
  return json{{"window_start", TimeUtils::formatTimestamp(window.start)},
              {"window_end", TimeUtils::formatTimestamp(window.end)},
              {"started_at", started_at},
              {"duration_ms", duration_ms},
              {"status", hasFailures() ? "PARTIAL" : "SUCCESS"},
              {"totals", totals().toJson()},
              {"entities", entityList}};
}

HistoryPipeline::HistoryPipeline(const EntityConfigRepository &repository,
                                 const IRawObservationStore &rawStore,
                                 IVersionedStore &versionedStore,
                                 PipelineOptions options)
    : repository_(repository), rawStore_(rawStore),
      versionedStore_(versionedStore), options_(options) {
  if (options_.history_batch_size == 0) {
    throw std::invalid_argument("history_batch_size must be at least 1");
  }
}

EntityRunReport HistoryPipeline::runEntity(const EntityConfig &entity,
                                           const TimeWindow &window) {
  EntityRunReport report;
  report.entity = entity.name;

  ChangeWindowDetector detector(rawStore_);
  std::set<std::string> changed = detector.changedKeys(entity.name, window);
  report.changed_keys = changed.size();
  if (changed.empty()) {
    return report;
  }

  const std::vector<std::string> keys(changed.begin(), changed.end());
  const VersionBuilder builder(options_.versions);
  std::vector<VersionedRecord> settled;
  size_t emitted = 0;
  std::mutex resultMutex;

  for (size_t offset = 0, batchNumber = 1; offset < keys.size();
       offset += options_.history_batch_size, ++batchNumber) {
    ParallelProcessing::KeyBatch batch;
    batch.entity = entity.name;
    batch.batchNumber = batchNumber;
    batch.keys.assign(keys.begin() + offset,
                      keys.begin() + std::min(keys.size(),
                                              offset +
                                                  options_.history_batch_size));

    // The batch's histories live only for this iteration.
    const auto histories = rawStore_.histories(entity.name, batch.keys);
    const auto purged = rawStore_.purgedKeys(entity.name, batch.keys);

    KeyProcessorThreadPool pool(
        std::min(options_.max_workers, batch.keys.size()),
        entity.name + " batch " + std::to_string(batch.batchNumber));
    for (const auto &key : batch.keys) {
      pool.submitTask(key, [&](const std::string &k) {
        auto it = histories.find(k);
        if (it == histories.end()) {
          throw std::runtime_error("No retained history");
        }
        KeyRebuildResult result =
            builder.rebuild(it->second, window, purged.count(k) > 0);

        std::lock_guard<std::mutex> lock(resultMutex);
        report.observations_read += result.observations;
        report.duplicate_loaded_at += result.duplicate_loaded_at;
        report.collapsed += result.collapsed;
        if (result.boundary_gap)
          report.boundary_gaps++;
        emitted += result.emitted.size();
        for (auto &record : result.settled)
          settled.push_back(std::move(record));
      });
    }
    pool.waitForCompletion();
    report.keys_failed += pool.failedTasks();
  }

  // Rows from earlier windows are rewritten too: a new observation shifts
  // the version of every older row of its key.
  std::sort(settled.begin(), settled.end(), versionedRecordLess);
  versionedStore_.upsertVersions(entity.name, settled);
  report.records_emitted = emitted;

  Logger::info(LogCategory::HISTORY, "runEntity",
               entity.name + " " + window.toString() + ": " +
                   std::to_string(report.changed_keys) + " keys, " +
                   std::to_string(report.records_emitted) +
                   " records emitted, " + std::to_string(report.keys_failed) +
                   " failed");
  return report;
}

void HistoryPipeline::runBridges(const TimeWindow &window,
                                 RunReport &report) {
  BridgeBuilder bridges(repository_, versionedStore_);
  for (size_t i = 0; i < repository_.entities().size(); ++i) {
    const EntityConfig &entity = repository_.entities()[i];
    EntityRunReport &entityReport = report.entities[i];
    try {
      std::vector<BridgeRow> rows = bridges.bridgeForWindow(entity.name, window);
      BridgeEntityStats stats = bridges.stats(entity.name);
      entityReport.quarantined += stats.quarantined;
      entityReport.missing_components += stats.missing_components;
      entityReport.malformed_hooks += stats.malformed_hooks;
      versionedStore_.upsertBridgeRows(entity.name, rows);
      entityReport.bridge_rows = rows.size();

      EventBridgeBuilder events(entity);
      if (events.hasEvents()) {
        EventBuildStats eventStats;
        std::vector<EventRow> eventRows = events.buildEvents(rows, eventStats);
        versionedStore_.upsertEventRows(entity.name, eventRows);
        entityReport.event_rows = eventRows.size();
        entityReport.skipped_events =
            eventStats.skipped_null + eventStats.skipped_unparseable;
      }
    } catch (const std::exception &e) {
      entityReport.errors.push_back(std::string("bridge: ") + e.what());
      Logger::error(LogCategory::BRIDGE, "runBridges",
                    entity.name + ": " + e.what());
    }
  }
}

RunReport HistoryPipeline::run(const TimeWindow &window) {
  RunReport report(window);
  report.started_at = TimeUtils::getCurrentTimestamp();
  auto start = std::chrono::steady_clock::now();
  Logger::info(LogCategory::HISTORY, "run",
               "Processing window " + window.toString() + " for " +
                   std::to_string(repository_.entities().size()) +
                   " entities");

  for (const auto &entity : repository_.entities()) {
    try {
      report.entities.push_back(runEntity(entity, window));
    } catch (const std::exception &e) {
      EntityRunReport failed;
      failed.entity = entity.name;
      failed.errors.push_back(std::string("history: ") + e.what());
      report.entities.push_back(failed);
      Logger::error(LogCategory::HISTORY, "run",
                    entity.name + ": " + e.what());
    }
  }

  runBridges(window, report);

  report.duration_ms = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - start)
                           .count();

  EntityRunReport total = report.totals();
  Logger::info(LogCategory::HISTORY, "run",
               "Window " + window.toString() + " done: " +
                   std::to_string(total.records_emitted) + " records, " +
                   std::to_string(total.bridge_rows) + " bridge rows, " +
                   std::to_string(total.event_rows) + " event rows, " +
                   std::to_string(total.keys_failed) + " failed keys, " +
                   std::to_string(total.boundary_gaps) + " boundary gaps");

  try {
    versionedStore_.recordRun(report.toJson());
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "run",
                  std::string("Could not record run: ") + e.what());
  }
  return report;
}

AsOfTable HistoryPipeline::asOf(const TimeWindow &window) const {
  std::vector<EventRow> events;
  for (const auto &entity : repository_.entities()) {
    for (auto &row : versionedStore_.eventRows(entity.name)) {
      if (window.contains(row.bridge.updated_at))
        events.push_back(std::move(row));
    }
  }
  return EventBridgeBuilder::unionAsOf(events);
}
