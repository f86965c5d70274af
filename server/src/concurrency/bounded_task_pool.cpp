#include "concurrency/bounded_task_pool.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace concurrency {

BoundedTaskPool::BoundedTaskPool(std::size_t workerCount) {
  const std::size_t count = std::max<std::size_t>(workerCount, 1);
  workers_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back(
        [this](const std::stop_token &stopToken) { workerLoop(stopToken); });
  }
}

BoundedTaskPool::~BoundedTaskPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    tasks_.clear();
  }

  for (auto &worker : workers_) {
    worker.request_stop();
  }
  tasksCv_.notify_all();
  // std::jthread joins on destruction
}

bool BoundedTaskPool::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return false;
    }
    tasks_.push_back(std::move(task));
  }
  tasksCv_.notify_one();
  return true;
}

std::size_t BoundedTaskPool::pendingTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void BoundedTaskPool::workerLoop(const std::stop_token &stopToken) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      tasksCv_.wait(lock, stopToken, [this] { return !tasks_.empty(); });
      if (stopToken.stop_requested() || tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }

    try {
      task();
    } catch (const std::exception &ex) {
      std::cerr << "Task pool: task failed: " << ex.what() << std::endl;
    }
  }
}

} // namespace concurrency
