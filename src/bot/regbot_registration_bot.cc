#include "regbot_registration_bot.h"
#include "logger.h"
#include "regbot_assignment.h"
#include "regbot_http_client.h"
#include "regbot_registrant_sheet.h"
#include "regbot_text_utils.h"
#include <algorithm>
#include <cstdlib>
#include <map>
#include <sstream>

namespace regbot {

namespace {

std::string RowLabel(const PendingCaptchaTask& task) {
  return "[" + task.key.day_label + "] Row " + std::to_string(task.row.DisplayNumber());
}

// "/retry@my_bot 3" -> {"/retry", "3"}
std::pair<std::string, std::string> SplitCommand(const std::string& text) {
  size_t space = text.find_first_of(" \t\n");
  std::string command = space == std::string::npos ? text : text.substr(0, space);
  std::string args = space == std::string::npos ? "" : Trim(text.substr(space + 1));

  size_t at = command.find('@');
  if (at != std::string::npos) {
    command = command.substr(0, at);
  }
  return {ToLower(command), args};
}

}  // namespace

RegistrationBot::RegistrationBot(const BotOptions& options,
                                 IMessenger& messenger,
                                 ISiteGateway& gateway,
                                 DayRegistry& registry,
                                 DayScheduler& scheduler,
                                 PendingCaptchaStore& pending,
                                 CaptchaAttemptLoop& resume_loop)
    : options_(options),
      messenger_(messenger),
      gateway_(gateway),
      registry_(registry),
      scheduler_(scheduler),
      pending_(pending),
      resume_loop_(resume_loop) {}

bool RegistrationBot::IsAdmin(const std::string& sender_id) const {
  if (options_.admins.empty()) {
    return true;
  }
  return std::find(options_.admins.begin(), options_.admins.end(), sender_id) !=
         options_.admins.end();
}

void RegistrationBot::Reply(const InboundMessage& message, const std::string& text) {
  messenger_.SendText(message.channel_id, text);
}

void RegistrationBot::Run(const std::atomic<bool>& stop) {
  LOG_INFO("Bot", "Polling for operator messages");
  while (!stop.load()) {
    PollOnce();
  }
  LOG_INFO("Bot", "Polling stopped");
}

void RegistrationBot::PollOnce() {
  for (const auto& message : messenger_.PollUpdates()) {
    HandleMessage(message);
  }
  DeliverFinishedBatches();
}

void RegistrationBot::HandleMessage(const InboundMessage& message) {
  if (!IsAdmin(message.sender_id)) {
    LOG_DEBUG("Bot", "Ignoring message from non-admin " + message.sender_id);
    return;
  }

  if (message.document_file_id) {
    HandleDocument(message);
    return;
  }

  std::string text = Trim(message.text);
  if (text.empty()) {
    return;
  }

  if (text[0] != '/') {
    HandleCaptchaReply(message);
    return;
  }

  auto [command, args] = SplitCommand(text);
  if (command == "/start") {
    HandleStart(message);
  } else if (command == "/status") {
    HandleStatus(message);
  } else if (command == "/retry") {
    HandleRetry(message, args);
  } else {
    Reply(message, "Unknown command. Use /start for help.");
  }
}

void RegistrationBot::HandleStart(const InboundMessage& message) {
  std::string columns;
  for (const auto& name : RegistrantSheet::RequiredColumns()) {
    columns += (columns.empty() ? "" : ", ") + name;
  }
  Reply(message, "Send a .csv file with the columns: " + columns +
                 ", optional SessionName. Every sales date on the form gets its own worker.");
}

void RegistrationBot::HandleStatus(const InboundMessage& message) {
  std::ostringstream out;

  std::vector<PendingCaptchaKey> keys = pending_.PendingFor(message.channel_id);
  out << "Pending captchas: " << keys.size();
  for (const auto& key : keys) {
    out << "\n  [" << key.day_label << "] row " << key.row_index + 1;
  }

  auto days = registry_.Snapshot();
  out << "\nActive day tasks: " << scheduler_.ActiveDayCount() << " ("
      << scheduler_.QueuedDayCount() << " queued, " << scheduler_.WorkerCount() << " workers)";
  for (const auto& [label, state] : days) {
    out << "\n  " << label << ": " << DayStateToString(state);
  }

  Reply(message, out.str());
}

void RegistrationBot::HandleRetry(const InboundMessage& message, const std::string& args) {
  if (args.empty()) {
    Reply(message, "Usage: /retry <row>");
    return;
  }

  char* end = nullptr;
  long row = std::strtol(args.c_str(), &end, 10);
  if (end == args.c_str() || *end != '\0' || row < 1) {
    Reply(message, "Row must be a positive number.");
    return;
  }

  Reply(message, "Send the sheet again to start a new run, then answer the captcha for row " +
                 std::to_string(row) + ".");
}

void RegistrationBot::HandleDocument(const InboundMessage& message) {
  if (!EndsWith(ToLower(message.document_name), ".csv")) {
    Reply(message, "Please send a .csv file.");
    return;
  }

  try {
    std::vector<uint8_t> data = messenger_.DownloadDocument(*message.document_file_id);
    std::vector<RegistrantRow> rows =
        RegistrantSheet::Parse(std::string(data.begin(), data.end()));
    if (rows.empty()) {
      Reply(message, "The sheet has no registrant rows.");
      return;
    }

    std::string html = gateway_.FetchFormPage();
    std::vector<std::string> labels = gateway_.ExtractSalesDayLabels(html);
    if (labels.empty()) {
      Reply(message, "No sales dates found on the form.");
      return;
    }

    Assignment assignment = BuildAssignment(labels, rows, options_.assignment_mode);
    size_t day_count = UniqueDayLabels(labels).size();
    size_t workers = std::min(day_count, static_cast<size_t>(std::max(1, options_.max_day_workers)));

    Reply(message, "Found " + std::to_string(day_count) + " days on the form. Running up to " +
                   std::to_string(workers) + " workers (one per day), rows assigned " +
                   AssignmentModeToString(options_.assignment_mode) + " from the sheet (" +
                   std::to_string(rows.size()) + " rows).");

    DayBatch batch = scheduler_.Start(labels, assignment, message.channel_id);
    if (!batch.skipped.empty()) {
      std::string skipped;
      for (const auto& label : batch.skipped) {
        skipped += (skipped.empty() ? "" : ", ") + label;
      }
      Reply(message, "Skipped days already running or done: " + skipped);
    }
    if (batch.claimed.empty()) {
      Reply(message, "No days left to run.");
    }
  } catch (const SheetError& e) {
    Reply(message, std::string("Sheet rejected: ") + e.what());
  } catch (const NetworkError& e) {
    Reply(message, std::string("Could not load the form: ") + e.what());
  } catch (const std::exception& e) {
    LOG_ERROR("Bot", std::string("Sheet upload failed: ") + e.what());
    Reply(message, std::string("Upload failed: ") + e.what());
  }
}

void RegistrationBot::HandleCaptchaReply(const InboundMessage& message) {
  // A reply names its prompt; only a bare message falls back to the channel
  std::optional<PendingCaptchaTask> task =
      message.reply_to_message_id
          ? pending_.PopByPrompt(message.channel_id, *message.reply_to_message_id)
          : pending_.PopByChannel(message.channel_id);
  if (!task) {
    Reply(message, "No pending captcha task.");
    return;
  }

  const int row_number = task->row.DisplayNumber();
  try {
    ManualResumeResult result = resume_loop_.ResumeManual(*task, Trim(message.text));
    switch (result.outcome) {
      case SubmissionOutcome::SUCCESS:
        Reply(message, "✅ " + RowLabel(*task) + " registered.");
        break;
      case SubmissionOutcome::CAPTCHA_REJECTED:
        Reply(message, "❌ " + RowLabel(*task) + ": wrong or expired captcha. Use /retry " +
                       std::to_string(row_number) + " to try again.");
        break;
      case SubmissionOutcome::SESSION_FULL:
        Reply(message, "⛔ " + RowLabel(*task) + ": session is full.");
        break;
      case SubmissionOutcome::OTHER_FAILURE:
        Reply(message, "⚠️ " + RowLabel(*task) + " not successful: " +
                       TruncateUtf8(result.raw_response, 500));
        break;
    }
  } catch (const std::exception& e) {
    LOG_ERROR("Bot", RowLabel(*task) + " manual submit failed: " + e.what());
    Reply(message, "❌ " + RowLabel(*task) + " submit error: " + e.what());
  }
}

std::string RegistrationBot::FormatBatchSummary(const BatchResult& batch) {
  std::ostringstream out;
  out << "Batch " << batch.id << " finished.";

  for (const auto& report : batch.reports) {
    std::map<RowStatus, int> counts;
    for (const auto& row : report.rows) {
      ++counts[row.status];
    }

    out << "\n[" << report.label << "] " << DayStatusToString(report.status);
    if (!report.rows.empty()) {
      out << ", " << report.rows.size() << " rows:";
      bool first = true;
      for (const auto& [status, count] : counts) {
        out << (first ? " " : ", ") << count << " " << RowStatusToString(status);
        first = false;
      }
    }
    if (!report.message.empty()) {
      out << " (" << report.message << ")";
    }
  }

  out << "\nIf captcha images are still open, reply to them with the code.";
  return out.str();
}

size_t RegistrationBot::DeliverFinishedBatches() {
  std::vector<BatchResult> finished = scheduler_.TakeFinished();
  for (const auto& batch : finished) {
    messenger_.SendText(batch.channel_id, FormatBatchSummary(batch));
  }
  return finished.size();
}

}  // namespace regbot
