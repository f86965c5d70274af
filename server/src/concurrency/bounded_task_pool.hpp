#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace concurrency {

/**
 * @brief Fixed set of worker threads draining a FIFO task queue.
 *
 * The number of workers bounds how many tasks run at once, whatever the
 * number of submitted tasks. Tasks still queued when the pool is destroyed
 * are discarded; running tasks are joined.
 */
class BoundedTaskPool {
public:
  using Task = std::function<void()>;

  explicit BoundedTaskPool(std::size_t workerCount);
  ~BoundedTaskPool();

  BoundedTaskPool(const BoundedTaskPool &) = delete;
  BoundedTaskPool &operator=(const BoundedTaskPool &) = delete;
  BoundedTaskPool(BoundedTaskPool &&) = delete;
  BoundedTaskPool &operator=(BoundedTaskPool &&) = delete;

  // Returns false once the pool is shutting down.
  bool submit(Task task);

  std::size_t workerCount() const { return workers_.size(); }

  std::size_t pendingTasks() const;

private:
  void workerLoop(const std::stop_token &stopToken);

  mutable std::mutex mutex_;
  std::condition_variable_any tasksCv_;
  std::deque<Task> tasks_;
  bool stopping_ = false;
  std::vector<std::jthread> workers_;
};

} // namespace concurrency
