#include "regbot_response_classifier.h"
#include "regbot_text_utils.h"

namespace regbot {

const ResponseMarkers& ResponseMarkers::Default() {
  static const ResponseMarkers markers;
  return markers;
}

SubmissionOutcome ClassifyResponse(const std::string& raw, const ResponseMarkers& markers) {
  if (raw.find(markers.success_marker) != std::string::npos) {
    return SubmissionOutcome::SUCCESS;
  }

  std::string lowered = ToLower(raw);
  for (const auto& phrase : markers.session_full_phrases) {
    if (lowered.find(ToLower(phrase)) != std::string::npos) {
      return SubmissionOutcome::SESSION_FULL;
    }
  }

  if (lowered.find(ToLower(markers.captcha_marker)) != std::string::npos) {
    return SubmissionOutcome::CAPTCHA_REJECTED;
  }

  return SubmissionOutcome::OTHER_FAILURE;
}

}  // namespace regbot
