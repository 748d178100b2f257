#ifndef KEYPROCESSORTHREADPOOL_H
#define KEYPROCESSORTHREADPOOL_H

#include "sync/ParallelProcessing.h"
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

struct KeyTask {
  std::string key;
  std::function<void(const std::string &)> processor;
};

// Fixed-size worker pool for per-key rebuilds. A task that throws is logged
// and counted; the other tasks carry on. The pool is single-use: after
// waitForCompletion() no more tasks are accepted.
class KeyProcessorThreadPool {
private:
  std::vector<std::thread> workers_;
  ThreadSafeQueue<KeyTask> tasks_;
  std::atomic<size_t> activeWorkers_{0};
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};
  std::atomic<bool> shutdown_{false};
  std::string label_;

  void workerThread(size_t workerId);

public:
  KeyProcessorThreadPool(size_t numWorkers, const std::string &label);
  ~KeyProcessorThreadPool();

  KeyProcessorThreadPool(const KeyProcessorThreadPool &) = delete;
  KeyProcessorThreadPool &operator=(const KeyProcessorThreadPool &) = delete;

  void submitTask(const std::string &key,
                  std::function<void(const std::string &)> processor);

  void waitForCompletion();
  void shutdown();

  size_t activeWorkers() const { return activeWorkers_.load(); }
  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
  size_t pendingTasks() const { return tasks_.size(); }
  size_t totalWorkers() const { return workers_.size(); }
};

#endif
