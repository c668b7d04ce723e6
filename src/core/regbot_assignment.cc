#include "regbot_assignment.h"
#include <set>

namespace regbot {

std::vector<std::string> UniqueDayLabels(const std::vector<std::string>& labels) {
  std::vector<std::string> unique;
  std::set<std::string> seen;
  for (const auto& label : labels) {
    if (seen.insert(label).second) {
      unique.push_back(label);
    }
  }
  return unique;
}

Assignment BuildAssignment(const std::vector<std::string>& labels,
                           const std::vector<RegistrantRow>& rows,
                           AssignmentMode mode) {
  Assignment assignment;
  if (rows.empty()) {
    return assignment;
  }

  for (const auto& label : UniqueDayLabels(labels)) {
    assignment[label];
  }

  switch (mode) {
    case AssignmentMode::ROUND_ROBIN:
      for (size_t i = 0; i < labels.size(); ++i) {
        assignment[labels[i]].push_back(rows[i % rows.size()]);
      }
      break;

    case AssignmentMode::ALL_ROWS:
      for (auto& entry : assignment) {
        entry.second = rows;
      }
      break;
  }

  return assignment;
}

}  // namespace regbot
