#include "../test_runner.h"
#include "sync/KeyProcessorThreadPool.h"
#include <mutex>
#include <set>
#include <stdexcept>

int main() {
  TestRunner runner;

  runner.runTest("Every submitted key is processed once", [&]() {
    std::mutex mutex;
    std::multiset<std::string> seen;
    KeyProcessorThreadPool pool(4, "test");
    runner.assertEquals(static_cast<size_t>(4), pool.totalWorkers(),
                        "worker count");
    for (int i = 0; i < 200; ++i) {
      pool.submitTask("key" + std::to_string(i), [&](const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(key);
      });
    }
    pool.waitForCompletion();
    runner.assertEquals(static_cast<size_t>(200), seen.size(), "all keys");
    runner.assertEquals(static_cast<size_t>(1), seen.count("key42"), "once");
    runner.assertEquals(static_cast<size_t>(200), pool.completedTasks(),
                        "completed counter");
    runner.assertEquals(static_cast<size_t>(0), pool.pendingTasks(),
                        "queue drained");
  });

  runner.runTest("A failing key does not stop the others", [&]() {
    std::atomic<size_t> done{0};
    KeyProcessorThreadPool pool(2, "failing");
    for (int i = 0; i < 10; ++i) {
      pool.submitTask(std::to_string(i), [&](const std::string &key) {
        if (key == "3" || key == "7")
          throw std::runtime_error("bad key");
        done++;
      });
    }
    pool.waitForCompletion();
    runner.assertEquals(static_cast<size_t>(8), done.load(), "others ran");
    runner.assertEquals(static_cast<size_t>(2), pool.failedTasks(),
                        "failures counted");
  });

  runner.runTest("Submissions after completion are refused", [&]() {
    bool ran = false;
    KeyProcessorThreadPool pool(1, "closed");
    pool.waitForCompletion();
    pool.submitTask("late", [&](const std::string &) { ran = true; });
    pool.shutdown();
    runner.assertFalse(ran, "not run");
    runner.assertEquals(static_cast<size_t>(0), pool.pendingTasks(),
                        "not queued");
  });

  runner.runTest("Zero workers falls back to the hardware count", [&]() {
    KeyProcessorThreadPool pool(0, "auto");
    runner.assertTrue(pool.totalWorkers() >= 1, "at least one worker");
    pool.waitForCompletion();
  });

  return runner.printSummary();
}
