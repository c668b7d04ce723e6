#pragma once

#include <string>
#include <vector>
#include "regbot_config.h"
#include "regbot_types.h"

namespace regbot {

// Distinct labels in first-seen order
std::vector<std::string> UniqueDayLabels(const std::vector<std::string>& labels);

/**
 * Distribute rows over the scraped day labels.
 *
 * ROUND_ROBIN walks the labels as scraped (duplicates included) and gives the
 * i-th label row i mod n. ALL_ROWS gives every distinct day every row in sheet
 * order. Every distinct label gets an entry, possibly empty; no rows yields an
 * empty assignment.
 */
Assignment BuildAssignment(const std::vector<std::string>& labels,
                           const std::vector<RegistrantRow>& rows,
                           AssignmentMode mode);

}  // namespace regbot
