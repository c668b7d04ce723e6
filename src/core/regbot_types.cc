#include "regbot_types.h"

namespace regbot {

std::string DayStateToString(DayState state) {
  switch (state) {
    case DayState::PENDING:   return "pending";
    case DayState::ACTIVE:    return "active";
    case DayState::COMPLETED: return "completed";
  }
  return "unknown";
}

std::string SubmissionOutcomeToString(SubmissionOutcome outcome) {
  switch (outcome) {
    case SubmissionOutcome::SUCCESS:          return "success";
    case SubmissionOutcome::SESSION_FULL:     return "session_full";
    case SubmissionOutcome::CAPTCHA_REJECTED: return "captcha_rejected";
    case SubmissionOutcome::OTHER_FAILURE:    return "other_failure";
  }
  return "unknown";
}

std::string RowStatusToString(RowStatus status) {
  switch (status) {
    case RowStatus::SUCCESS:       return "success";
    case RowStatus::SESSION_FULL:  return "session_full";
    case RowStatus::OTHER_FAILURE: return "other_failure";
    case RowStatus::FAILED:        return "failed";
    case RowStatus::AWAIT_MANUAL:  return "await_manual";
    case RowStatus::ERROR:         return "error";
  }
  return "unknown";
}

std::string DayStatusToString(DayStatus status) {
  switch (status) {
    case DayStatus::COMPLETED:    return "completed";
    case DayStatus::ABORTED_FULL: return "aborted_session_full";
    case DayStatus::NO_SESSIONS:  return "no_sessions";
    case DayStatus::FAILED:       return "failed";
  }
  return "unknown";
}

}  // namespace regbot
