#include "regbot_thread_pool.h"
#include "logger.h"
#include <algorithm>

namespace regbot {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::max<size_t>(2, std::thread::hardware_concurrency());
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this, i);
  }

  LOG_DEBUG("ThreadPool", "Started " + std::to_string(num_threads) + " workers");
}

ThreadPool::~ThreadPool() {
  Shutdown();
}

void ThreadPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return;  // Already shutdown
    }
    shutdown_.store(true, std::memory_order_release);
  }

  queue_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  workers_.clear();
}

size_t ThreadPool::GetQueueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

void ThreadPool::WorkerLoop(size_t worker_id) {
  while (true) {
    Task task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });

      // Pending tasks are still run after shutdown was requested
      if (queue_.empty()) {
        return;
      }

      task = std::move(queue_.front());
      queue_.pop();
    }

    LOG_DEBUG("ThreadPool", "Worker " + std::to_string(worker_id) + " running " + task.name);
    task.func();  // packaged_task stores exceptions in the future
  }
}

}  // namespace regbot
