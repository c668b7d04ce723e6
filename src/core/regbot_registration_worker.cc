#include "regbot_registration_worker.h"
#include "logger.h"
#include "regbot_text_utils.h"
#include <exception>

namespace regbot {

RegistrationWorker::RegistrationWorker(ISiteGateway& gateway,
                                       CaptchaAttemptLoop& loop,
                                       IMessenger& messenger,
                                       const std::string& channel_id)
    : gateway_(gateway),
      loop_(loop),
      messenger_(messenger),
      channel_id_(channel_id) {}

std::optional<Session> RegistrationWorker::SelectSession(const std::vector<Session>& sessions,
                                                         const std::vector<RegistrantRow>& rows) {
  if (sessions.empty()) {
    return std::nullopt;
  }

  for (const auto& row : rows) {
    if (!row.session_name) {
      continue;
    }
    std::string wanted = Trim(*row.session_name);
    if (wanted.empty()) {
      continue;
    }
    for (const auto& session : sessions) {
      if (session.label == wanted) {
        return session;
      }
    }
  }

  return sessions.front();
}

void RegistrationWorker::Notify(const std::string& text) {
  messenger_.SendText(channel_id_, text);
}

void RegistrationWorker::ReportRow(const RowResult& result) {
  std::string prefix = "[" + result.day_label + "] Row " + std::to_string(result.row_index + 1);

  switch (result.status) {
    case RowStatus::SUCCESS:
      Notify("✅ " + prefix + " registered (attempt " + std::to_string(result.attempts) + "/" +
             std::to_string(loop_.MaxAttempts()) + ").");
      break;
    case RowStatus::FAILED:
      Notify("⏭️ " + prefix + " skipped after " + std::to_string(result.attempts) +
             " attempts. " + result.detail);
      break;
    case RowStatus::OTHER_FAILURE:
      Notify("⚠️ " + prefix + " " + result.detail);
      break;
    case RowStatus::SESSION_FULL:
      Notify("⛔ " + prefix + ": session is full. " + result.detail);
      break;
    case RowStatus::ERROR:
      Notify("❌ " + prefix + " error: " + result.detail);
      break;
    case RowStatus::AWAIT_MANUAL:
      break;  // The captcha photo is the report
  }
}

DayReport RegistrationWorker::Run(const std::string& day_label,
                                  const std::vector<RegistrantRow>& rows) {
  DayReport report;
  report.label = day_label;

  try {
    std::string html = gateway_.FetchFormPage();
    auto day_id = gateway_.MapLabelToId(html, day_label);
    if (!day_id) {
      report.status = DayStatus::FAILED;
      report.message = "sale day id not found on the form";
      Notify("[" + day_label + "] Sale day id not found on the form.");
      return report;
    }

    std::vector<Session> sessions = gateway_.LoadSessions(*day_id);
    auto session = SelectSession(sessions, rows);
    if (!session) {
      report.status = DayStatus::NO_SESSIONS;
      report.message = "no sessions open for registration";
      Notify("[" + day_label + "] No sessions open for registration.");
      return report;
    }

    LOG_INFO("Worker", "[" + day_label + "] day id " + *day_id + ", session '" + session->label +
             "', " + std::to_string(rows.size()) + " rows");

    report.status = DayStatus::COMPLETED;
    for (size_t i = 0; i < rows.size(); ++i) {
      const RegistrantRow& row = rows[i];

      RowResult result;
      try {
        result = loop_.Run({channel_id_, day_label, *day_id, *session, row});
      } catch (const std::exception& e) {
        result.day_label = day_label;
        result.row_index = row.index;
        result.status = RowStatus::ERROR;
        result.detail = e.what();
        LOG_ERROR("Worker", "[" + day_label + "] row " + std::to_string(row.DisplayNumber()) +
                  ": " + e.what());
      }

      report.rows.push_back(result);
      ReportRow(result);

      if (result.status == RowStatus::SESSION_FULL) {
        size_t skipped = rows.size() - i - 1;
        report.status = DayStatus::ABORTED_FULL;
        report.message = "session full at row " + std::to_string(row.DisplayNumber()) + ", " +
                         std::to_string(skipped) + " remaining rows skipped";
        Notify("[" + day_label + "] Session full, stopping this day. " +
               std::to_string(skipped) + " remaining rows skipped.");
        break;
      }
    }
  } catch (const std::exception& e) {
    report.status = DayStatus::FAILED;
    report.message = e.what();
    LOG_ERROR("Worker", "[" + day_label + "] " + e.what());
    Notify("[" + day_label + "] Error: " + std::string(e.what()));
  }

  return report;
}

}  // namespace regbot
