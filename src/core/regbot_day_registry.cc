#include "regbot_day_registry.h"
#include "logger.h"
#include <algorithm>

namespace regbot {

DayRegistry::DayRegistry(DayRetryPolicy policy)
    : policy_(policy) {}

std::vector<std::string> DayRegistry::Claim(const std::vector<std::string>& candidates) {
  std::vector<std::string> claimed;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& label : candidates) {
    auto it = states_.find(label);
    if (it != states_.end() && it->second != DayState::PENDING) {
      continue;  // ACTIVE elsewhere, COMPLETED, or claimed earlier in this call
    }
    states_[label] = DayState::ACTIVE;
    claimed.push_back(label);
  }

  return claimed;
}

void DayRegistry::Release(const std::string& label, bool succeeded) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = states_.find(label);
  if (it == states_.end() || it->second != DayState::ACTIVE) {
    LOG_WARN("DayRegistry", "Release of day that is not active: " + label);
    return;
  }

  if (!succeeded && policy_ == DayRetryPolicy::RETRY_ON_FAILURE) {
    it->second = DayState::PENDING;
    LOG_INFO("DayRegistry", "Day " + label + " failed, returned to pending");
  } else {
    it->second = DayState::COMPLETED;
  }
}

DayState DayRegistry::StateOf(const std::string& label) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(label);
  return it == states_.end() ? DayState::PENDING : it->second;
}

std::map<std::string, DayState> DayRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return states_;
}

size_t DayRegistry::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(states_.begin(), states_.end(), [](const auto& entry) {
    return entry.second == DayState::ACTIVE;
  }));
}

}  // namespace regbot
