#include "../northwind_fixture.h"
#include "../test_runner.h"
#include "catalog/entity_config_repository.h"
#include "core/history_errors.h"
#include "sync/Fingerprinter.h"
#include "sync/RawStager.h"

int main() {
  TestRunner runner;
  EntityConfigRepository repository;
  repository.loadFromJson(northwindEntities());
  const EntityConfig &customers = repository.getEntity("customers");

  runner.runTest("Load ids become timestamps", [&]() {
    runner.assertEquals(
        std::string("2023-11-14 22:13:20.123456"),
        TimeUtils::formatTimestamp(
            RawStager::loadIdToTimestamp("1700000000.123456")),
        "decimal string keeps microseconds");
    runner.assertEquals(
        std::string("2023-11-14 22:13:20.000000"),
        TimeUtils::formatTimestamp(RawStager::loadIdToTimestamp("1700000000")),
        "whole seconds");
    runner.assertEquals(
        std::string("2023-11-14 22:13:20.500000"),
        TimeUtils::formatTimestamp(RawStager::loadIdToTimestamp(1700000000.5)),
        "numeric load id");
    runner.assertThrows<std::invalid_argument>(
        []() { RawStager::loadIdToTimestamp("yesterday"); }, "not a number");
    runner.assertThrows<std::invalid_argument>(
        []() { RawStager::loadIdToTimestamp(json::array()); }, "wrong type");
  });

  runner.runTest("Landing row to observation", [&]() {
    MemoryRawObservationStore store;
    RawStager stager(customers, store, "_dlt", "_dlt_load_id");
    RawObservation observation =
        stager.toObservation(customerRow("ALFKI", "Berlin", marchDay(1)));
    runner.assertEquals(std::string("ALFKI"), observation.unique_key, "key");
    runner.assertEquals(TimeUtils::formatTimestamp(marchDay(1)),
                        TimeUtils::formatTimestamp(observation.loaded_at),
                        "loaded_at from load id");
    runner.assertFalse(observation.payload.contains("_dlt_load_id"),
                       "metadata stripped");
    runner.assertFalse(observation.payload.contains("_dlt_id"),
                       "all prefixed columns stripped");
    runner.assertEquals(
        Fingerprinter::fingerprint({{"customer_id", "ALFKI"},
                                    {"company_name", "ALFKI GmbH"},
                                    {"city", "Berlin"}}),
        observation.content_hash, "hash over the attribute list");
  });

  runner.runTest("Staging deduplicates by key and hash", [&]() {
    MemoryRawObservationStore store;
    RawStager stager(customers, store, "_dlt", "_dlt_load_id");
    StagingResult first =
        stager.stage({customerRow("ALFKI", "Berlin", marchDay(1)),
                      customerRow("ALFKI", "Berlin", marchDay(2)),
                      customerRow("ANATR", "Mexico", marchDay(2))});
    runner.assertEquals(static_cast<size_t>(3), first.received, "received");
    runner.assertEquals(static_cast<size_t>(2), first.staged, "staged");
    runner.assertEquals(static_cast<size_t>(1), first.duplicates,
                        "in-batch duplicate");
    runner.assertEquals(TimeUtils::formatTimestamp(marchDay(1)),
                        TimeUtils::formatTimestamp(
                            store.history("customers", "ALFKI")[0].loaded_at),
                        "earliest copy kept");

    StagingResult second =
        stager.stage({customerRow("ALFKI", "Berlin", marchDay(3)),
                      customerRow("ALFKI", "Hamburg", marchDay(3))});
    runner.assertEquals(static_cast<size_t>(1), second.already_stored,
                        "unchanged row not appended again");
    runner.assertEquals(static_cast<size_t>(1), second.staged, "change staged");
    runner.assertEquals(static_cast<size_t>(3), store.size("customers"),
                        "store size");
    runner.assertEquals(2, second.toJson()["received"].get<int>(),
                        "report serialised");
  });

  runner.runTest("Rows without key or load id are quarantined", [&]() {
    MemoryRawObservationStore store;
    RawStager stager(customers, store, "_dlt", "_dlt_load_id");
    json noKey = customerRow("ALFKI", "Berlin", marchDay(1));
    noKey.erase("customer_id");
    json noLoad = customerRow("ANATR", "Mexico", marchDay(1));
    noLoad.erase("_dlt_load_id");

    runner.assertThrows<MissingHookComponentError>(
        [&]() { stager.toObservation(noKey); }, "missing key");
    StagingResult result =
        stager.stage({noKey, noLoad, customerRow("BONAP", "Marseille",
                                                 marchDay(1))});
    runner.assertEquals(static_cast<size_t>(2), result.quarantined,
                        "two quarantined");
    runner.assertEquals(static_cast<size_t>(1), result.staged,
                        "valid row still staged");
    runner.assertEquals(static_cast<size_t>(2), result.issues.size(),
                        "issues listed");
  });

  return runner.printSummary();
}
