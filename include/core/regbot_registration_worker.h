#pragma once

#include <optional>
#include <string>
#include <vector>
#include "regbot_captcha_attempt_loop.h"
#include "regbot_messenger.h"
#include "regbot_site_gateway.h"
#include "regbot_types.h"

namespace regbot {

/**
 * RegistrationWorker - Drives every assigned row of one claimed sale day
 *
 * Resolves the day id and its sessions, picks one session for the whole run,
 * then feeds the rows one at a time through the attempt loop. A session-full
 * response stops the day; any other row error is reported and the next row
 * continues. Run() reports progress to the operator channel and never throws.
 */
class RegistrationWorker {
public:
  RegistrationWorker(ISiteGateway& gateway,
                     CaptchaAttemptLoop& loop,
                     IMessenger& messenger,
                     const std::string& channel_id);

  DayReport Run(const std::string& day_label, const std::vector<RegistrantRow>& rows);

  /**
   * Session for a whole day run: the first row (in order) naming a session
   * whose label matches exactly wins; otherwise the first session.
   * Returns nullopt only when sessions is empty.
   */
  static std::optional<Session> SelectSession(const std::vector<Session>& sessions,
                                              const std::vector<RegistrantRow>& rows);

private:
  void ReportRow(const RowResult& result);
  void Notify(const std::string& text);

  ISiteGateway& gateway_;
  CaptchaAttemptLoop& loop_;
  IMessenger& messenger_;
  std::string channel_id_;
};

}  // namespace regbot
