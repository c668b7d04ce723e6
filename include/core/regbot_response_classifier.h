#pragma once

#include <string>
#include <vector>
#include "regbot_types.h"

namespace regbot {

/**
 * Markers that the registration endpoint uses in its raw response text.
 * Part of the site contract: swapping the site means swapping this table,
 * the attempt loop only sees SubmissionOutcome.
 */
struct ResponseMarkers {
  std::string success_marker = "!!!True|~~|";
  std::string captcha_marker = "captcha";
  // Matched case-insensitively (ASCII folding), so accented capitals are
  // listed as separate variants
  std::vector<std::string> session_full_phrases = {
      "hết chỗ", "Hết chỗ", "HẾT CHỖ",
      "hết suất", "Hết suất", "HẾT SUẤT",
      "hết vé", "Hết vé",
      "hết số lượng", "Hết số lượng",
      "đã đủ số lượng", "Đã đủ số lượng",
      "đã đầy", "Đã đầy", "phiên đã đầy", "Phiên đã đầy",
      "session is full", "session full", "fully booked", "sold out", "no slots left",
  };

  static const ResponseMarkers& Default();
};

/**
 * Classify a registration response.
 * Precedence: success marker, then session-full phrases, then the captcha
 * marker; anything else is OTHER_FAILURE.
 */
SubmissionOutcome ClassifyResponse(const std::string& raw,
                                   const ResponseMarkers& markers = ResponseMarkers::Default());

}  // namespace regbot
