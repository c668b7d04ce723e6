#include "regbot_day_scheduler.h"
#include "logger.h"
#include "regbot_assignment.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>

namespace regbot {

DayScheduler::DayScheduler(DayRegistry& registry, size_t max_day_workers, DayRunner runner)
    : registry_(registry),
      runner_(std::move(runner)),
      pool_(std::max<size_t>(1, max_day_workers)) {
  if (!runner_) {
    throw std::invalid_argument("DayScheduler requires a day runner");
  }
}

DayScheduler::~DayScheduler() {
  Shutdown();
}

void DayScheduler::Shutdown() {
  pool_.Shutdown();
}

DayReport DayScheduler::RunDay(const std::string& label,
                               const std::vector<RegistrantRow>& rows,
                               const std::string& channel_id) {
  DayReport report;
  report.label = label;

  try {
    report = runner_(label, rows, channel_id);
  } catch (const std::exception& e) {
    LOG_ERROR("Scheduler", "[" + label + "] day task failed: " + e.what());
    report.status = DayStatus::FAILED;
    report.message = e.what();
  } catch (...) {
    registry_.Release(label, false);
    active_days_.fetch_sub(1, std::memory_order_acq_rel);
    throw;
  }

  registry_.Release(label, report.Succeeded());
  active_days_.fetch_sub(1, std::memory_order_acq_rel);

  LOG_INFO("Scheduler", "[" + label + "] released, " + DayStatusToString(report.status) +
           (report.message.empty() ? "" : " (" + report.message + ")"));
  return report;
}

DayBatch DayScheduler::Start(const std::vector<std::string>& labels,
                             const Assignment& assignment,
                             const std::string& channel_id) {
  std::vector<std::string> candidates;
  for (const auto& label : UniqueDayLabels(labels)) {
    auto it = assignment.find(label);
    if (it != assignment.end() && !it->second.empty()) {
      candidates.push_back(label);
    }
  }

  DayBatch batch;
  if (pool_.IsShutdown()) {
    LOG_WARN("Scheduler", "Shutting down, no new days are started");
    batch.skipped = candidates;
    return batch;
  }

  std::vector<std::string> claimed = registry_.Claim(candidates);
  for (const auto& label : candidates) {
    if (std::find(claimed.begin(), claimed.end(), label) == claimed.end()) {
      batch.skipped.push_back(label);
    }
  }

  PendingBatch pending;
  pending.channel_id = channel_id;

  for (const auto& label : claimed) {
    const std::vector<RegistrantRow>& rows = assignment.at(label);
    active_days_.fetch_add(1, std::memory_order_acq_rel);
    try {
      pending.reports.push_back(
          pool_.Submit("day " + label, &DayScheduler::RunDay, this, label, rows, channel_id));
      batch.claimed.push_back(label);
    } catch (const std::runtime_error& e) {
      // Pool already stopped, the day was never run
      LOG_WARN("Scheduler", "[" + label + "] not started: " + e.what());
      active_days_.fetch_sub(1, std::memory_order_acq_rel);
      registry_.Release(label, false);
      batch.skipped.push_back(label);
    }
  }

  {
    std::lock_guard<std::mutex> lock(batches_mutex_);
    batch.id = next_batch_id_++;
    if (!pending.reports.empty()) {
      batches_.emplace(batch.id, std::move(pending));
    }
  }

  LOG_INFO("Scheduler", "Batch " + std::to_string(batch.id) + ": " +
           std::to_string(batch.claimed.size()) + " days started, " +
           std::to_string(batch.skipped.size()) + " skipped");
  return batch;
}

std::vector<DayReport> DayScheduler::Collect(PendingBatch& batch) {
  std::vector<DayReport> reports;
  reports.reserve(batch.reports.size());
  for (auto& future : batch.reports) {
    reports.push_back(future.get());
  }
  return reports;
}

std::vector<DayReport> DayScheduler::Wait(uint64_t batch_id) {
  PendingBatch batch;
  {
    std::lock_guard<std::mutex> lock(batches_mutex_);
    auto it = batches_.find(batch_id);
    if (it == batches_.end()) {
      return {};
    }
    batch = std::move(it->second);
    batches_.erase(it);
  }
  return Collect(batch);
}

std::vector<BatchResult> DayScheduler::TakeFinished() {
  std::vector<std::pair<uint64_t, PendingBatch>> done;
  {
    std::lock_guard<std::mutex> lock(batches_mutex_);
    for (auto it = batches_.begin(); it != batches_.end();) {
      bool ready = std::all_of(it->second.reports.begin(), it->second.reports.end(),
                               [](const std::future<DayReport>& f) {
                                 return f.wait_for(std::chrono::seconds(0)) ==
                                        std::future_status::ready;
                               });
      if (ready) {
        done.emplace_back(it->first, std::move(it->second));
        it = batches_.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::vector<BatchResult> results;
  for (auto& entry : done) {
    BatchResult result;
    result.id = entry.first;
    result.channel_id = entry.second.channel_id;
    result.reports = Collect(entry.second);
    results.push_back(std::move(result));
  }
  return results;
}

size_t DayScheduler::PendingBatchCount() const {
  std::lock_guard<std::mutex> lock(batches_mutex_);
  return batches_.size();
}

}  // namespace regbot
