/**
 * @file task_queue.hpp
 * @brief Thread-safe blocking queue for the two-stage pipeline
 *
 * @details TaskQueue<T> serves both ends of the pipeline:
 *
 *          - feed queue: the orchestrator pushes jobs, transcode workers pop
 *
 *          - completion queue: workers push results, the single transfer
 *            consumer pops them in completion order
 */

#ifndef TRANSYNC_TASK_QUEUE_HPP
#define TRANSYNC_TASK_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

#include "cancellation.hpp"

namespace transync {

/**
 * @class TaskQueue
 * @brief Thread-safe FIFO with a "no more items" signal.
 *
 * @attention USAGE:
 *
 *   - Producers call push()
 *
 *   - Consumers call pop() in a loop until it returns false
 *
 *   - The last producer calls finish(); cancel() also drops what is queued
 */
template <typename T> class TaskQueue {
public:
  /**
   * @brief Add an item to the queue.
   * @note Ignored once the queue was canceled.
   */
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (canceled_)
        return;
      items_.push(std::move(item));
    }
    cv_.notify_one();
  }

  /**
   * @brief Pop an item (blocking).
   * @param item Output: the next item
   * @return true if an item was retrieved, false if finished and empty
   */
  bool pop(T &item) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !items_.empty() || done_; });
    return take(item);
  }

  /**
   * @brief Pop an item, giving up when the token is set.
   * @note The token is checked every `poll` since a signal handler cannot
   *       notify the condition variable.
   * @return true if an item was retrieved
   */
  bool pop(T &item, const CancellationToken &token,
           std::chrono::milliseconds poll = std::chrono::milliseconds(100)) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (items_.empty() && !done_) {
      if (token.requested())
        return false;
      cv_.wait_for(lock, poll);
    }
    if (token.requested())
      return false;
    return take(item);
  }

  /**
   * @brief Signal that no more items will be pushed.
   * @note Wakes all waiting consumers so they can drain and exit.
   */
  void finish() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
  }

  /**
   * @brief Drop every queued item and finish.
   */
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      std::queue<T>().swap(items_);
      canceled_ = true;
      done_ = true;
    }
    cv_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

private:
  bool take(T &item) {
    if (items_.empty())
      return false;
    item = std::move(items_.front());
    items_.pop();
    return true;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> items_;
  bool done_ = false;
  bool canceled_ = false;
};

} // namespace transync

#endif // TRANSYNC_TASK_QUEUE_HPP
