#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed-size worker pool for day tasks.
// Each submitted task gets its own future, so callers can track and collect
// results of independently failing tasks; an exception thrown by a task is
// stored in its future and never reaches the worker thread.

namespace regbot {

class ThreadPool {
public:
  // num_threads = 0 uses hardware_concurrency (at least 2)
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // Submit a task, returns future for result.
  // Throws std::runtime_error once the pool is shut down.
  template<typename F, typename... Args>
  auto Submit(const std::string& name, F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Drains the queue, then joins all workers
  void Shutdown();

  size_t GetWorkerCount() const { return workers_.size(); }
  size_t GetQueueSize() const;
  bool IsShutdown() const { return shutdown_.load(std::memory_order_acquire); }

private:
  struct Task {
    std::function<void()> func;
    std::string name;
  };

  void WorkerLoop(size_t worker_id);

  std::vector<std::thread> workers_;
  std::queue<Task> queue_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::atomic<bool> shutdown_{false};
};

// ============================================================
// Template Implementations
// ============================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(const std::string& name, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...)
  );

  std::future<return_type> result = task->get_future();

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      throw std::runtime_error("ThreadPool is shut down, rejected task: " + name);
    }

    Task t;
    t.func = [task]() { (*task)(); };
    t.name = name;

    queue_.push(std::move(t));
  }

  queue_cv_.notify_one();
  return result;
}

}  // namespace regbot
