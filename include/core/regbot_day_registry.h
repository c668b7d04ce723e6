#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "regbot_config.h"
#include "regbot_types.h"

namespace regbot {

/**
 * DayRegistry - Exclusive ownership of sale days
 *
 * A label is ACTIVE in at most one worker at a time. Under NEVER_RETRY a
 * released label is COMPLETED for the rest of the process and is never handed
 * out again; under RETRY_ON_FAILURE a label released as failed goes back to
 * PENDING. Every read-modify-write happens under one mutex.
 */
class DayRegistry {
public:
  explicit DayRegistry(DayRetryPolicy policy = DayRetryPolicy::NEVER_RETRY);

  DayRegistry(const DayRegistry&) = delete;
  DayRegistry& operator=(const DayRegistry&) = delete;

  // Claims every candidate that is neither ACTIVE nor COMPLETED, in input
  // order. A label repeated in the candidates is claimed once.
  std::vector<std::string> Claim(const std::vector<std::string>& candidates);

  // Ends the claim on label. Releasing a label that is not ACTIVE is logged
  // and ignored.
  void Release(const std::string& label, bool succeeded);

  DayState StateOf(const std::string& label) const;
  std::map<std::string, DayState> Snapshot() const;
  size_t ActiveCount() const;

  DayRetryPolicy GetPolicy() const { return policy_; }

private:
  DayRetryPolicy policy_;
  mutable std::mutex mutex_;
  std::map<std::string, DayState> states_;
};

}  // namespace regbot
