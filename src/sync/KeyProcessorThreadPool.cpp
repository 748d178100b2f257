#include "sync/KeyProcessorThreadPool.h"
#include "core/logger.h"
#include <algorithm>

// A worker count of 0 falls back to the hardware concurrency.
KeyProcessorThreadPool::KeyProcessorThreadPool(size_t numWorkers,
                                               const std::string &label)
    : label_(label) {
  if (numWorkers == 0) {
    numWorkers = std::max<size_t>(1, std::thread::hardware_concurrency());
    Logger::warning(LogCategory::HISTORY, "KeyProcessorThreadPool",
                    "numWorkers was 0, using hardware_concurrency: " +
                        std::to_string(numWorkers));
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&KeyProcessorThreadPool::workerThread, this, i);
  }

  Logger::debug(LogCategory::HISTORY, "KeyProcessorThreadPool",
                label_ + ": started " + std::to_string(numWorkers) +
                    " workers");
}

KeyProcessorThreadPool::~KeyProcessorThreadPool() { shutdown(); }

// Pops tasks until the queue is finished and drained. Failures are counted
// per task so one bad key never stops the worker.
void KeyProcessorThreadPool::workerThread(size_t workerId) {
  KeyTask task;
  while (tasks_.popBlocking(task)) {
    activeWorkers_++;
    try {
      task.processor(task.key);
      completedTasks_++;
    } catch (const std::exception &e) {
      failedTasks_++;
      Logger::error(LogCategory::HISTORY, "KeyProcessorThreadPool",
                    label_ + ": worker #" + std::to_string(workerId) +
                        " failed key '" + task.key + "': " + e.what());
    }
    activeWorkers_--;
  }
}

void KeyProcessorThreadPool::submitTask(
    const std::string &key,
    std::function<void(const std::string &)> processor) {
  if (shutdown_.load()) {
    Logger::warning(LogCategory::HISTORY, "submitTask",
                    "Cannot submit key '" + key +
                        "' - thread pool is shutting down");
    return;
  }
  tasks_.push(KeyTask{key, std::move(processor)});
}

void KeyProcessorThreadPool::waitForCompletion() {
  shutdown_ = true;
  tasks_.finish();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  Logger::debug(LogCategory::HISTORY, "KeyProcessorThreadPool",
                label_ + ": completed " +
                    std::to_string(completedTasks_.load()) + ", failed " +
                    std::to_string(failedTasks_.load()));
}

// Idempotent. Pending tasks are still drained before the workers exit.
void KeyProcessorThreadPool::shutdown() {
  shutdown_ = true;
  tasks_.finish();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}
