#ifndef PARALLELPROCESSING_H
#define PARALLELPROCESSING_H

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

// Unbounded MPMC queue. After finish() consumers drain what is left and then
// popBlocking returns false.
template <typename T> class ThreadSafeQueue {
private:
  mutable std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable cv;
  std::atomic<bool> finished{false};

public:
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      queue.push(std::move(item));
    }
    cv.notify_one();
  }

  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || finished; });
    if (queue.empty()) {
      return false;
    }
    item = std::move(queue.front());
    queue.pop();
    return true;
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      finished = true;
    }
    cv.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
  }
};

namespace ParallelProcessing {
// One slice of changed keys whose histories are loaded, rebuilt and released
// together.
struct KeyBatch {
  std::string entity;
  size_t batchNumber = 0;
  std::vector<std::string> keys;
};
} // namespace ParallelProcessing

#endif
