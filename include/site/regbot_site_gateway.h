#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "regbot_types.h"

namespace regbot {

/**
 * ISiteGateway - Contract between the registration core and the target form
 *
 * All methods that touch the network may throw NetworkError once the
 * implementation's own bounded retry is exhausted. Parsing methods are pure.
 * Implementations must be safe to call from several day workers at once.
 */
class ISiteGateway {
public:
  virtual ~ISiteGateway() = default;

  /**
   * Fetch the registration form page
   * @return Page HTML
   */
  virtual std::string FetchFormPage() = 0;

  /**
   * List the visible sale-day labels in document order.
   * Entries without both a label and an id are skipped.
   */
  virtual std::vector<std::string> ExtractSalesDayLabels(const std::string& html) = 0;

  /**
   * Resolve a sale-day label to the form's internal id
   * @return The id, or nullopt when the label is not on the page
   */
  virtual std::optional<std::string> MapLabelToId(const std::string& html,
                                                  const std::string& label) = 0;

  /**
   * Load the sessions of a sale day, in the order the site returns them
   */
  virtual std::vector<Session> LoadSessions(const std::string& day_id) = 0;

  /**
   * Request a fresh captcha challenge
   * @return Absolute image URL, or nullopt when the site returned no image
   */
  virtual std::optional<std::string> FetchCaptchaChallengeRef() = 0;

  virtual std::vector<uint8_t> DownloadImage(const std::string& ref) = 0;

  /**
   * Submit one registration
   * @return Raw response text, trimmed
   */
  virtual std::string SubmitRegistration(const FormFields& fields) = 0;
};

}  // namespace regbot
