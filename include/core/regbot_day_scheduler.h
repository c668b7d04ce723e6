#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "regbot_day_registry.h"
#include "regbot_thread_pool.h"
#include "regbot_types.h"

namespace regbot {

// Runs one claimed day to completion. Builds its own worker, so every day
// task gets an independent attempt loop.
using DayRunner = std::function<DayReport(const std::string& day_label,
                                          const std::vector<RegistrantRow>& rows,
                                          const std::string& channel_id)>;

struct DayBatch {
  uint64_t id = 0;
  std::vector<std::string> claimed;  // days a task was started for, in order
  std::vector<std::string> skipped;  // already active or completed
};

struct BatchResult {
  uint64_t id = 0;
  std::string channel_id;
  std::vector<DayReport> reports;
};

/**
 * DayScheduler - Supervisor for per-day tasks
 *
 * Start() claims days through the registry and queues one task per claimed
 * day on a fixed pool of max_day_workers threads. A task releases its day
 * exactly once, whatever the runner does. Reports are collected per batch
 * with Wait() or, without blocking, TakeFinished().
 */
class DayScheduler {
public:
  DayScheduler(DayRegistry& registry, size_t max_day_workers, DayRunner runner);
  ~DayScheduler();

  DayScheduler(const DayScheduler&) = delete;
  DayScheduler& operator=(const DayScheduler&) = delete;

  // Labels missing from the assignment or without rows are not claimed.
  DayBatch Start(const std::vector<std::string>& labels,
                 const Assignment& assignment,
                 const std::string& channel_id);

  // Blocks until every task of the batch is done. Unknown or already
  // collected batch ids return an empty list.
  std::vector<DayReport> Wait(uint64_t batch_id);

  // Batches whose tasks have all finished, removed from tracking
  std::vector<BatchResult> TakeFinished();

  size_t ActiveDayCount() const { return active_days_.load(std::memory_order_acquire); }
  size_t PendingBatchCount() const;
  size_t QueuedDayCount() const { return pool_.GetQueueSize(); }
  size_t WorkerCount() const { return pool_.GetWorkerCount(); }

  // Runs the queued days, then stops the pool. Start() afterwards claims nothing.
  void Shutdown();

private:
  struct PendingBatch {
    std::string channel_id;
    std::vector<std::future<DayReport>> reports;
  };

  DayReport RunDay(const std::string& label,
                   const std::vector<RegistrantRow>& rows,
                   const std::string& channel_id);

  static std::vector<DayReport> Collect(PendingBatch& batch);

  DayRegistry& registry_;
  DayRunner runner_;
  std::atomic<size_t> active_days_{0};

  mutable std::mutex batches_mutex_;
  std::map<uint64_t, PendingBatch> batches_;
  uint64_t next_batch_id_ = 1;

  ThreadPool pool_;  // last, so it joins before the members its tasks touch go away
};

}  // namespace regbot
