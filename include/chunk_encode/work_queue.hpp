/**
 * @file work_queue.hpp
 * @brief Thread-safe blocking queue for producer-consumer pools
 *
 * @details Used in both directions by the pools:
 *
 *          - Pipeline jobs flow from the scheduler to encode workers
 *
 *          - Outcomes flow back to the single draining thread
 *
 *          - Metric requests flow to metric workers
 */

#ifndef CHUNK_ENCODE_WORK_QUEUE_HPP
#define CHUNK_ENCODE_WORK_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace chunk_encode {

/**
 * @class WorkQueue
 * @brief Thread-safe queue for dynamic load balancing.
 *
 * @attention USAGE:
 *
 *   - Producers call push()
 *
 *   - Workers call pop() in a loop until it returns false
 *
 *   - Call finish() when nothing more will be pushed, or clear() to drop
 *     queued work on cancellation
 */
template <typename T> class WorkQueue {
public:
  /**
   * @brief Add an item to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push(std::move(item));
    }
    cv_.notify_one();
  }

  /**
   * @brief Pop an item (blocking).
   * @param item Output: the popped item
   * @return true if an item was retrieved, false if finished and empty
   */
  bool pop(T &item) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !items_.empty() || done_.load(); });

    if (items_.empty())
      return false;

    item = std::move(items_.front());
    items_.pop();
    return true;
  }

  /**
   * @brief Pop an item, waiting at most `timeout`.
   * @return true if an item was retrieved, false on timeout or when finished
   */
  template <typename Rep, typename Period>
  bool pop_for(T &item, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout,
                 [this] { return !items_.empty() || done_.load(); });

    if (items_.empty())
      return false;

    item = std::move(items_.front());
    items_.pop();
    return true;
  }

  /**
   * @brief Signal that no more items will be pushed.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish() {
    {
      /// Under the lock so a waiter cannot check the predicate and then
      /// miss the notification
      std::lock_guard<std::mutex> lock(mutex_);
      done_.store(true);
    }
    cv_.notify_all();
  }

  /**
   * @brief Drop every queued item.
   * @return Number of items discarded
   */
  size_t clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = items_.size();
    std::queue<T>().swap(items_);
    return n;
  }

  bool is_done() const { return done_.load() && empty(); }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> items_;
  std::atomic<bool> done_{false};
};

} // namespace chunk_encode

#endif // CHUNK_ENCODE_WORK_QUEUE_HPP
