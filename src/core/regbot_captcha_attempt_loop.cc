#include "regbot_captcha_attempt_loop.h"
#include "logger.h"
#include "regbot_http_client.h"
#include "regbot_registration_payload.h"
#include "regbot_text_utils.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace regbot {

std::string AttemptStateToString(AttemptState state) {
  switch (state) {
    case AttemptState::INIT:              return "init";
    case AttemptState::CAPTCHA_REQUESTED: return "captcha_requested";
    case AttemptState::SOLVING:           return "solving";
    case AttemptState::AWAIT_MANUAL:      return "await_manual";
    case AttemptState::SUBMITTED:         return "submitted";
    case AttemptState::SUCCESS:           return "success";
    case AttemptState::CAPTCHA_REJECTED:  return "captcha_rejected";
    case AttemptState::SESSION_FULL:      return "session_full";
    case AttemptState::OTHER_FAILURE:     return "other_failure";
    case AttemptState::FAILED:            return "failed";
  }
  return "unknown";
}

CaptchaAttemptLoop::CaptchaAttemptLoop(std::shared_ptr<ISiteGateway> gateway,
                                       ICaptchaSolver* solver,
                                       IMessenger& messenger,
                                       PendingCaptchaStore& pending,
                                       const AttemptLoopConfig& config,
                                       SiteSessionFactory manual_sessions,
                                       const ResponseMarkers& markers)
    : gateway_(std::move(gateway)),
      solver_(solver),
      messenger_(messenger),
      pending_(pending),
      config_(config),
      manual_sessions_(std::move(manual_sessions)),
      markers_(markers) {
  if (!gateway_) {
    throw std::invalid_argument("CaptchaAttemptLoop needs a site gateway");
  }
}

bool CaptchaAttemptLoop::AutoSolveActive() const {
  return config_.auto_solve && solver_ && solver_->IsAvailable();
}

void CaptchaAttemptLoop::Transition(const RowContext& ctx, AttemptState state, int attempt) {
  LOG_DEBUG("AttemptLoop", "[" + ctx.day_label + "] row " + std::to_string(ctx.row.DisplayNumber()) +
            " attempt " + std::to_string(attempt) + " -> " + AttemptStateToString(state));
}

SubmissionOutcome CaptchaAttemptLoop::SubmitAndClassify(ISiteGateway& site,
                                                        const std::string& day_id,
                                                        const std::string& session_id,
                                                        const RegistrantRow& row,
                                                        const std::string& captcha_text,
                                                        std::string& raw_response) {
  FormFields payload = BuildRegistrationPayload(day_id, session_id, row, captcha_text);
  raw_response = site.SubmitRegistration(payload);
  return ClassifyResponse(raw_response, markers_);
}

std::shared_ptr<ISiteGateway> CaptchaAttemptLoop::OpenOperatorSession() {
  if (!manual_sessions_) {
    return gateway_;
  }
  std::shared_ptr<ISiteGateway> site = manual_sessions_();
  return site ? site : gateway_;
}

RowResult CaptchaAttemptLoop::HandOverToOperator(const RowContext& ctx,
                                                 std::shared_ptr<ISiteGateway> site,
                                                 const std::vector<uint8_t>& image,
                                                 int attempts_used) {
  std::string caption = "[" + ctx.day_label + "] Row " + std::to_string(ctx.row.DisplayNumber()) +
                        ": reply to this message with the captcha code.";

  // Sent before the task is stored, so a reply can never pop a task whose
  // prompt id is about to change
  int64_t prompt_id = messenger_.SendImage(ctx.channel_id, image, caption);
  if (prompt_id == 0) {
    LOG_WARN("AttemptLoop", "[" + ctx.day_label + "] captcha image for row " +
             std::to_string(ctx.row.DisplayNumber()) + " was not delivered");
  }

  PendingCaptchaTask task;
  task.key = {ctx.channel_id, ctx.day_label, ctx.row.index};
  task.day_id = ctx.day_id;
  task.session_id = ctx.session.id;
  task.row = ctx.row;
  task.prompt_message_id = prompt_id;
  task.site = std::move(site);
  pending_.Put(task);

  RowResult result;
  result.day_label = ctx.day_label;
  result.row_index = ctx.row.index;
  result.status = RowStatus::AWAIT_MANUAL;
  result.attempts = attempts_used;
  result.detail = "waiting for operator captcha";
  return result;
}

RowResult CaptchaAttemptLoop::Run(const RowContext& ctx) {
  // Reject unusable rows before spending captchas on them
  NormalizeIntegerField("DOB_Day", ctx.row.dob_day);
  NormalizeIntegerField("DOB_Month", ctx.row.dob_month);
  NormalizeIntegerField("DOB_Year", ctx.row.dob_year);

  const bool auto_solve = AutoSolveActive();
  const int max_attempts = std::max(1, config_.max_attempts);

  RowResult result;
  result.day_label = ctx.day_label;
  result.row_index = ctx.row.index;

  Transition(ctx, AttemptState::INIT, 0);

  std::string last_error;
  int attempt = 0;
  while (attempt < max_attempts) {
    ++attempt;
    result.attempts = attempt;

    try {
      Transition(ctx, AttemptState::CAPTCHA_REQUESTED, attempt);
      std::shared_ptr<ISiteGateway> site = auto_solve ? gateway_ : OpenOperatorSession();
      auto ref = site->FetchCaptchaChallengeRef();
      if (!ref) {
        Transition(ctx, AttemptState::OTHER_FAILURE, attempt);
        result.status = RowStatus::OTHER_FAILURE;
        result.detail = "could not load a captcha";
        return result;
      }
      std::vector<uint8_t> image = site->DownloadImage(*ref);

      if (!auto_solve) {
        Transition(ctx, AttemptState::AWAIT_MANUAL, attempt);
        return HandOverToOperator(ctx, site, image, attempt - 1);
      }

      Transition(ctx, AttemptState::SOLVING, attempt);
      auto answer = solver_->Solve(image);
      if (!answer) {
        last_error = "captcha solver gave no answer";
        continue;
      }

      Transition(ctx, AttemptState::SUBMITTED, attempt);
      std::string raw;
      SubmissionOutcome outcome = SubmitAndClassify(*site, ctx.day_id, ctx.session.id, ctx.row, *answer, raw);

      switch (outcome) {
        case SubmissionOutcome::SUCCESS:
          Transition(ctx, AttemptState::SUCCESS, attempt);
          result.status = RowStatus::SUCCESS;
          result.detail.clear();
          return result;

        case SubmissionOutcome::SESSION_FULL:
          Transition(ctx, AttemptState::SESSION_FULL, attempt);
          result.status = RowStatus::SESSION_FULL;
          result.detail = TruncateUtf8(raw, 200);
          return result;

        case SubmissionOutcome::CAPTCHA_REJECTED:
          Transition(ctx, AttemptState::CAPTCHA_REJECTED, attempt);
          last_error = "site rejected the captcha (attempt " + std::to_string(attempt) + "/" +
                       std::to_string(max_attempts) + ")";
          continue;

        case SubmissionOutcome::OTHER_FAILURE:
          // Unknown failure mode, resubmitting could register twice
          Transition(ctx, AttemptState::OTHER_FAILURE, attempt);
          result.status = RowStatus::OTHER_FAILURE;
          result.detail = "not successful: " + TruncateUtf8(raw, 200);
          return result;
      }
    } catch (const NetworkError& e) {
      last_error = "attempt " + std::to_string(attempt) + " error: " + e.what();
      LOG_WARN("AttemptLoop", "[" + ctx.day_label + "] row " + std::to_string(ctx.row.DisplayNumber()) +
               ": " + last_error);
    }
  }

  if (auto_solve && config_.manual_fallback_on_exhaustion) {
    LOG_INFO("AttemptLoop", "[" + ctx.day_label + "] row " + std::to_string(ctx.row.DisplayNumber()) +
             " exhausted automatic attempts, asking the operator");
    try {
      std::shared_ptr<ISiteGateway> site = OpenOperatorSession();
      auto ref = site->FetchCaptchaChallengeRef();
      if (ref) {
        std::vector<uint8_t> image = site->DownloadImage(*ref);
        Transition(ctx, AttemptState::AWAIT_MANUAL, attempt);
        return HandOverToOperator(ctx, site, image, attempt);
      }
      last_error += "; no captcha for operator fallback";
    } catch (const NetworkError& e) {
      last_error += std::string("; operator fallback failed: ") + e.what();
    }
  }

  Transition(ctx, AttemptState::FAILED, attempt);
  result.status = RowStatus::FAILED;
  result.attempts = attempt;
  result.detail = last_error;
  return result;
}

ManualResumeResult CaptchaAttemptLoop::ResumeManual(const PendingCaptchaTask& task,
                                                    const std::string& answer) {
  ManualResumeResult result;
  ISiteGateway& site = task.site ? *task.site : *gateway_;
  result.outcome = SubmitAndClassify(site, task.day_id, task.session_id, task.row, answer,
                                     result.raw_response);
  LOG_INFO("AttemptLoop", "[" + task.key.day_label + "] row " +
           std::to_string(task.row.DisplayNumber()) + " manual answer -> " +
           SubmissionOutcomeToString(result.outcome));
  return result;
}

}  // namespace regbot
