#pragma once

#include <tbb/concurrent_queue.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace utils {

/**
 * @brief FIFO over tbb::concurrent_queue with a bounded-wait pop.
 *
 * The mutex only serialises waiters against producers' wake-ups; push and
 * tryPop go straight to the lock-free queue.
 */
template <typename T>
class BlockingQueue {
 public:
  BlockingQueue() = default;
  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  void push(T value) {
    queue_.push(std::move(value));
    { std::lock_guard<std::mutex> lock(waitMutex_); }
    cv_.notify_one();
  }

  bool tryPop(T& out) { return queue_.try_pop(out); }

  template <typename Rep, typename Period>
  bool popFor(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    if (queue_.try_pop(out)) return true;
    std::unique_lock<std::mutex> lock(waitMutex_);
    return cv_.wait_for(lock, timeout, [&]() { return queue_.try_pop(out); });
  }

  std::vector<T> drain() {
    std::vector<T> items;
    T item;
    while (queue_.try_pop(item)) items.push_back(std::move(item));
    return items;
  }

  // Approximate while producers or consumers are active.
  size_t size() const {
    return static_cast<size_t>(queue_.unsafe_size());
  }

  bool empty() const { return queue_.empty(); }

 private:
  tbb::concurrent_queue<T> queue_;
  std::mutex waitMutex_;
  std::condition_variable cv_;
};

}  // namespace utils
