#include "../test_runner.h"
#include "sync/ChangeWindowDetector.h"

namespace {

RawObservation observe(const std::string &key, Timestamp loadedAt) {
  RawObservation observation;
  observation.unique_key = key;
  observation.loaded_at = loadedAt;
  observation.content_hash = key + TimeUtils::formatTimestamp(loadedAt);
  return observation;
}

} // namespace

int main() {
  TestRunner runner;
  const Timestamp d1 = TimeUtils::makeTimestamp(2024, 5, 1);
  const Timestamp d2 = TimeUtils::makeTimestamp(2024, 5, 2);
  const Timestamp d3 = TimeUtils::makeTimestamp(2024, 5, 3);

  MemoryRawObservationStore store;
  store.append("customers", {observe("ALFKI", d1), observe("ANATR", d2),
                             observe("ALFKI", d2), observe("BONAP", d3)});

  runner.runTest("Keys loaded inside the window", [&]() {
    ChangeWindowDetector detector(store);
    auto keys = detector.changedKeys("customers", TimeWindow(d2, d3));
    runner.assertEquals(static_cast<size_t>(2), keys.size(), "two keys");
    runner.assertTrue(keys.count("ALFKI") && keys.count("ANATR"),
                      "ALFKI and ANATR");
  });

  runner.runTest("Window end is exclusive", [&]() {
    ChangeWindowDetector detector(store);
    auto keys = detector.changedKeys("customers", TimeWindow(d1, d2));
    runner.assertEquals(static_cast<size_t>(1), keys.size(), "only d1 loads");
    runner.assertTrue(keys.count("ALFKI") == 1, "ALFKI");
  });

  runner.runTest("Empty and unknown", [&]() {
    ChangeWindowDetector detector(store);
    runner.assertTrue(
        detector
            .changedKeys("customers",
                         TimeWindow(TimeUtils::makeTimestamp(2025, 1, 1),
                                    TimeUtils::makeTimestamp(2025, 1, 2)))
            .empty(),
        "no loads");
    runner.assertTrue(
        detector.changedKeys("suppliers", TimeWindow(d1, d3)).empty(),
        "unknown entity");
  });

  runner.runTest("Static overload over observations", [&]() {
    auto keys = ChangeWindowDetector::changedKeys(
        {observe("A", d1), observe("B", d3)}, TimeWindow(d1, d3));
    runner.assertEquals(static_cast<size_t>(1), keys.size(), "one key");
  });

  return runner.printSummary();
}
