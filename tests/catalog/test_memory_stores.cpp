#include "../northwind_fixture.h"
#include "../test_runner.h"
#include "catalog/raw_observation_store.h"
#include "catalog/versioned_store.h"
#include "sync/VersionBuilder.h"

namespace {

RawObservation observe(const std::string &key, Timestamp loadedAt,
                       const std::string &hash, const json &payload) {
  RawObservation observation;
  observation.unique_key = key;
  observation.loaded_at = loadedAt;
  observation.content_hash = hash;
  observation.payload = payload;
  return observation;
}

VersionedRecord version(const std::string &key, Timestamp loadedAt) {
  VersionedRecord record;
  record.unique_key = key;
  record.loaded_at = loadedAt;
  record.content_hash = "h" + TimeUtils::formatTimestamp(loadedAt);
  record.valid_from = TimeUtils::minTimestamp();
  record.valid_to = TimeUtils::maxTimestamp();
  record.updated_at = loadedAt;
  record.version = 1;
  record.is_current = true;
  return record;
}

} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Raw store scans, histories and columns", [&]() {
    MemoryRawObservationStore store;
    store.append("customers",
                 {observe("ALFKI", marchDay(1), "a1", {{"id", 1}, {"city", "x"}}),
                  observe("ANATR", marchDay(2), "b1", {{"id", 2}, {"zip", "1"}}),
                  observe("ALFKI", marchDay(3), "a2", {{"id", 1}})});

    auto scanned =
        store.scanWindow("customers", TimeWindow(marchDay(2), marchDay(4)));
    runner.assertEquals(static_cast<size_t>(2), scanned.size(), "two rows");
    runner.assertEquals(std::string("ANATR"), scanned[0].unique_key,
                        "arrival order");

    auto histories = store.histories("customers", {"ALFKI", "BONAP"});
    runner.assertEquals(static_cast<size_t>(1), histories.size(),
                        "unknown keys absent");
    runner.assertEquals(static_cast<size_t>(2), histories["ALFKI"].size(),
                        "full history");

    auto hashes = store.hashesByKey("customers", {"ALFKI"});
    runner.assertTrue(hashes["ALFKI"].count("a1") && hashes["ALFKI"].count("a2"),
                      "hashes by key");

    auto columns = store.columns("customers");
    runner.assertEquals(static_cast<size_t>(3), columns.size(), "columns");
    runner.assertEquals(std::string("zip"), columns[2], "first-seen order");
    runner.assertTrue(store.columns("orders").empty(), "unknown entity");
  });

  runner.runTest("Retention purge marks affected keys", [&]() {
    MemoryRawObservationStore store;
    store.append("customers",
                 {observe("ALFKI", marchDay(1), "a1", json::object()),
                  observe("ANATR", marchDay(4), "b1", json::object()),
                  observe("ALFKI", marchDay(5), "a2", json::object())});
    runner.assertEquals(static_cast<size_t>(1),
                        store.purgeBefore("customers", marchDay(3)), "removed");
    runner.assertEquals(static_cast<size_t>(2), store.size("customers"),
                        "remaining");
    auto purged = store.purgedKeys("customers", {"ALFKI", "ANATR"});
    runner.assertEquals(static_cast<size_t>(1), purged.size(), "one key");
    runner.assertTrue(store.hasPurgedHistory("customers", "ALFKI"), "ALFKI");
    runner.assertFalse(store.hasPurgedHistory("customers", "ANATR"), "ANATR");
    runner.assertEquals(static_cast<size_t>(0),
                        store.purgeBefore("orders", marchDay(3)),
                        "unknown entity");
  });

  runner.runTest("Versioned upsert stores ranks as derived", [&]() {
    std::vector<RawObservation> history = {
        observe("ALFKI", marchDay(1), "h1", {{"city", "Berlin"}}),
        observe("ALFKI", marchDay(2), "h2", {{"city", "Hamburg"}}),
        observe("ALFKI", marchDay(3), "h3", {{"city", "Bremen"}})};
    KeyRebuildResult result = VersionBuilder().rebuild(
        history, TimeWindow(marchDay(2), marchDay(3)));

    MemoryVersionedStore store;
    store.upsertVersions("customers", result.emitted);
    auto stored = store.history("customers", "ALFKI");
    runner.assertEquals(static_cast<size_t>(1), stored.size(),
                        "only the row closed in the window");
    runner.assertEquals(std::string("h1"), stored[0].content_hash, "first");
    runner.assertEquals(static_cast<int64_t>(3), stored[0].version,
                        "counts the later observations");
    runner.assertFalse(stored[0].is_current, "closed row stays closed");
    runner.assertEquals(TimeUtils::formatTimestamp(marchDay(2)),
                        TimeUtils::formatTimestamp(stored[0].valid_to),
                        "closed at the second load");

    store.upsertVersions("customers", {version("ALFKI", marchDay(1))});
    runner.assertEquals(static_cast<size_t>(1),
                        store.records("customers").size(),
                        "same loaded_at replaces");
    runner.assertTrue(store.history("customers", "ALFKI")[0].is_current,
                      "replacement written as given");
    runner.assertTrue(store.history("customers", "BONAP").empty(),
                      "unknown key");
  });

  runner.runTest("Bridge and event rows upsert by identity", [&]() {
    MemoryVersionedStore store;
    BridgeRow row;
    row.peripheral = "orders";
    row.hooks["_pit_hook__order"] =
        "northwind.order.id|1~epoch__valid_from|1970-01-01 00:00:00.000000";
    row.updated_at = marchDay(1);
    store.upsertBridgeRows("orders", {row});
    row.updated_at = marchDay(2);
    store.upsertBridgeRows("orders", {row});
    auto rows = store.bridgeRows("orders");
    runner.assertEquals(static_cast<size_t>(1), rows.size(), "replaced");
    runner.assertEquals(TimeUtils::formatTimestamp(marchDay(2)),
                        TimeUtils::formatTimestamp(rows[0].updated_at),
                        "latest write wins");

    EventRow placed;
    placed.bridge = row;
    placed.event = "order_placed";
    placed.occurred = marchDay(1);
    EventRow shipped = placed;
    shipped.event = "order_shipped";
    store.upsertEventRows("orders", {placed, shipped, placed});
    runner.assertEquals(static_cast<size_t>(2), store.eventRows("orders").size(),
                        "one row per event");
  });

  runner.runTest("Matched bridge row replaces the unmatched one", [&]() {
    const std::string orderPit =
        "northwind.order.id|1~epoch__valid_from|1970-01-01 00:00:00.000000";
    const std::string customerPit =
        "northwind.customer.id|ALFKI~epoch__valid_from|1970-01-01 "
        "00:00:00.000000";
    BridgeRow unmatched;
    unmatched.peripheral = "orders";
    unmatched.hooks["_pit_hook__order"] = orderPit;
    unmatched.hooks["_pit_hook__customer"] = "";
    unmatched.updated_at = marchDay(1);
    BridgeRow matched = unmatched;
    matched.hooks["_pit_hook__customer"] = customerPit;
    matched.attributes = {{"city__customers", "Berlin"}};
    matched.updated_at = marchDay(2);
    BridgeRow otherOrder = unmatched;
    otherOrder.hooks["_pit_hook__order"] =
        "northwind.order.id|2~epoch__valid_from|1970-01-01 00:00:00.000000";

    runner.assertTrue(matched.supersedes(unmatched), "fills the empty side");
    runner.assertFalse(unmatched.supersedes(matched), "not the other way");
    runner.assertFalse(matched.supersedes(matched), "nothing to fill");
    runner.assertFalse(matched.supersedes(otherOrder), "different order");

    MemoryVersionedStore store;
    store.upsertBridgeRows("orders", {unmatched, otherOrder});
    store.upsertBridgeRows("orders", {matched});
    auto rows = store.bridgeRows("orders");
    runner.assertEquals(static_cast<size_t>(2), rows.size(),
                        "stale row removed, unrelated row kept");
    size_t completed = 0;
    for (const auto &row : rows) {
      if (row == matched)
        ++completed;
      runner.assertFalse(row == unmatched, "no row claims a missing customer");
    }
    runner.assertEquals(static_cast<size_t>(1), completed, "matched row stored");
  });

  runner.runTest("Runs are recorded", [&]() {
    MemoryVersionedStore store;
    store.recordRun({{"status", "SUCCESS"}});
    runner.assertEquals(static_cast<size_t>(1), store.runs().size(), "one run");
  });

  runner.runTest("Record JSON round trip", [&]() {
    VersionedRecord record = version("ALFKI", marchDay(1));
    record.payload = {{"city", "Berlin"}};
    json row = record.toJson();
    runner.assertEquals(std::string("ALFKI"),
                        row["_unique_key"].get<std::string>(), "key column");
    runner.assertEquals(std::string("9999-12-31 23:59:59.000000"),
                        row["_valid_to"].get<std::string>(), "max sentinel");
    runner.assertTrue(VersionedRecord::fromJson(row) == record, "restored");
  });

  return runner.printSummary();
}
