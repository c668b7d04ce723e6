#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "regbot_captcha_solver.h"
#include "regbot_messenger.h"
#include "regbot_pending_captcha_store.h"
#include "regbot_response_classifier.h"
#include "regbot_site_gateway.h"
#include "regbot_types.h"

namespace regbot {

// States a row passes through, logged per transition
enum class AttemptState {
  INIT,
  CAPTCHA_REQUESTED,
  SOLVING,
  AWAIT_MANUAL,
  SUBMITTED,
  SUCCESS,
  CAPTCHA_REJECTED,
  SESSION_FULL,
  OTHER_FAILURE,
  FAILED
};

std::string AttemptStateToString(AttemptState state);

struct AttemptLoopConfig {
  int max_attempts = 4;
  bool auto_solve = false;                     // use the solver when it is available
  bool manual_fallback_on_exhaustion = false;  // one operator prompt after auto attempts run out
};

// Everything one row needs, resolved by the day worker
struct RowContext {
  std::string channel_id;
  std::string day_label;
  std::string day_id;
  Session session;
  RegistrantRow row;
};

// Opens a site session with its own cookie jar
using SiteSessionFactory = std::function<std::shared_ptr<ISiteGateway>()>;

struct ManualResumeResult {
  SubmissionOutcome outcome = SubmissionOutcome::OTHER_FAILURE;
  std::string raw_response;
};

/**
 * CaptchaAttemptLoop - Per-row captcha, submit and classify state machine
 *
 * INIT -> CAPTCHA_REQUESTED -> (SOLVING | AWAIT_MANUAL) -> SUBMITTED ->
 *   SUCCESS | SESSION_FULL | OTHER_FAILURE | CAPTCHA_REJECTED -> CAPTCHA_REQUESTED
 *
 * Each attempt requests a fresh challenge. A solver miss, a rejected captcha
 * or a NetworkError consumes one attempt. AWAIT_MANUAL hands the row to the
 * operator and returns immediately; it does not consume an attempt. After
 * max_attempts the row ends FAILED.
 *
 * One loop object serves every row of a day worker; it holds no per-row state.
 *
 * The site binds a captcha to the session that requested it. Automatic
 * attempts use the day's gateway. Every operator prompt fetches its captcha
 * on a session from manual_sessions (the day's gateway when none is given),
 * and the pending task keeps that session for ResumeManual.
 */
class CaptchaAttemptLoop {
public:
  CaptchaAttemptLoop(std::shared_ptr<ISiteGateway> gateway,
                     ICaptchaSolver* solver,
                     IMessenger& messenger,
                     PendingCaptchaStore& pending,
                     const AttemptLoopConfig& config,
                     SiteSessionFactory manual_sessions = SiteSessionFactory(),
                     const ResponseMarkers& markers = ResponseMarkers::Default());

  /**
   * Run the loop for one row.
   * Throws InvalidRowError before any network call when the row is unusable;
   * errors other than NetworkError propagate to the caller.
   */
  RowResult Run(const RowContext& ctx);

  /**
   * Submit an operator-typed answer for a task popped from the pending store,
   * on the session that fetched its captcha. Single attempt, no re-prompt.
   * May throw NetworkError or InvalidRowError.
   */
  ManualResumeResult ResumeManual(const PendingCaptchaTask& task, const std::string& answer);

  bool AutoSolveActive() const;
  int MaxAttempts() const { return config_.max_attempts; }

private:
  SubmissionOutcome SubmitAndClassify(ISiteGateway& site,
                                      const std::string& day_id,
                                      const std::string& session_id,
                                      const RegistrantRow& row,
                                      const std::string& captcha_text,
                                      std::string& raw_response);

  std::shared_ptr<ISiteGateway> OpenOperatorSession();

  RowResult HandOverToOperator(const RowContext& ctx,
                               std::shared_ptr<ISiteGateway> site,
                               const std::vector<uint8_t>& image,
                               int attempts_used);

  void Transition(const RowContext& ctx, AttemptState state, int attempt);

  std::shared_ptr<ISiteGateway> gateway_;
  ICaptchaSolver* solver_;
  IMessenger& messenger_;
  PendingCaptchaStore& pending_;
  AttemptLoopConfig config_;
  SiteSessionFactory manual_sessions_;
  ResponseMarkers markers_;
};

}  // namespace regbot
