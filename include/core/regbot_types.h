#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace regbot {

// Registration form fields, keyed by the site's parameter names
using FormFields = std::map<std::string, std::string>;

enum class DayState {
  PENDING,
  ACTIVE,
  COMPLETED
};

struct Session {
  std::string id;
  std::string label;
};

struct RegistrantRow {
  int index = 0;             // zero-based position in the ingested sheet
  std::string full_name;
  std::string dob_day;       // raw cell text, e.g. "5" or "5.0"
  std::string dob_month;
  std::string dob_year;
  std::string phone;
  std::string email;
  std::string id_number;
  std::optional<std::string> session_name;

  // 1-based number shown to operators
  int DisplayNumber() const { return index + 1; }
};

// Day label -> rows, in processing order
using Assignment = std::map<std::string, std::vector<RegistrantRow>>;

enum class SubmissionOutcome {
  SUCCESS,
  SESSION_FULL,
  CAPTCHA_REJECTED,
  OTHER_FAILURE
};

enum class RowStatus {
  SUCCESS,
  SESSION_FULL,
  OTHER_FAILURE,
  FAILED,        // attempt budget exhausted
  AWAIT_MANUAL,  // handed to the operator
  ERROR          // uncaught error while processing the row
};

struct RowResult {
  std::string day_label;
  int row_index = 0;
  RowStatus status = RowStatus::FAILED;
  int attempts = 0;
  std::string detail;
};

enum class DayStatus {
  COMPLETED,      // all assigned rows were processed
  ABORTED_FULL,   // stopped early on a session-full response
  NO_SESSIONS,    // the day had no sessions
  FAILED          // day id unresolved or a day-level error
};

struct DayReport {
  std::string label;
  DayStatus status = DayStatus::FAILED;
  std::vector<RowResult> rows;
  std::string message;

  bool Succeeded() const { return status != DayStatus::FAILED; }
};

std::string DayStateToString(DayState state);
std::string SubmissionOutcomeToString(SubmissionOutcome outcome);
std::string RowStatusToString(RowStatus status);
std::string DayStatusToString(DayStatus status);

}  // namespace regbot
