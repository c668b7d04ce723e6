#pragma once

#include <atomic>
#include <string>
#include <vector>
#include "regbot_captcha_attempt_loop.h"
#include "regbot_config.h"
#include "regbot_day_registry.h"
#include "regbot_day_scheduler.h"
#include "regbot_messenger.h"
#include "regbot_pending_captcha_store.h"
#include "regbot_site_gateway.h"

namespace regbot {

struct BotOptions {
  std::vector<std::string> admins;  // empty = everyone
  AssignmentMode assignment_mode = AssignmentMode::ROUND_ROBIN;
  int max_day_workers = 10;
};

/**
 * RegistrationBot - Operator command surface
 *
 *   /start         usage and the required sheet columns
 *   /status        pending captcha prompts of the chat and day states
 *   /retry <row>   re-upload instructions for a row
 *   <file>.csv     ingest rows, scrape days and start a batch
 *   any text       answer to a pending captcha prompt
 *
 * Messages are handled on the polling thread; day batches run on the
 * scheduler and their summaries go out from PollOnce().
 */
class RegistrationBot {
public:
  RegistrationBot(const BotOptions& options,
                  IMessenger& messenger,
                  ISiteGateway& gateway,
                  DayRegistry& registry,
                  DayScheduler& scheduler,
                  PendingCaptchaStore& pending,
                  CaptchaAttemptLoop& resume_loop);

  // Polls the messenger once, handles what arrived, then sends summaries of
  // finished batches.
  void PollOnce();

  // PollOnce() until stop is set
  void Run(const std::atomic<bool>& stop);

  void HandleMessage(const InboundMessage& message);

  // Summaries of batches whose days have all finished. Returns how many.
  size_t DeliverFinishedBatches();

  bool IsAdmin(const std::string& sender_id) const;

  static std::string FormatBatchSummary(const BatchResult& batch);

private:
  void HandleStart(const InboundMessage& message);
  void HandleStatus(const InboundMessage& message);
  void HandleRetry(const InboundMessage& message, const std::string& args);
  void HandleDocument(const InboundMessage& message);
  void HandleCaptchaReply(const InboundMessage& message);

  void Reply(const InboundMessage& message, const std::string& text);

  BotOptions options_;
  IMessenger& messenger_;
  ISiteGateway& gateway_;
  DayRegistry& registry_;
  DayScheduler& scheduler_;
  PendingCaptchaStore& pending_;
  CaptchaAttemptLoop& resume_loop_;
};

}  // namespace regbot
