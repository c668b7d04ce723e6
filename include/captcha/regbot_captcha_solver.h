#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regbot {

/**
 * ICaptchaSolver - Automatic captcha solving service
 *
 * Solve() is a single blocking call from the core's point of view; any polling
 * and its soft timeout live inside the implementation. Service errors are
 * reported as nullopt, never thrown.
 */
class ICaptchaSolver {
public:
  virtual ~ICaptchaSolver() = default;

  // Answer text, or nullopt on timeout or service error
  virtual std::optional<std::string> Solve(const std::vector<uint8_t>& image) = 0;

  // False when the solver is not configured (e.g. missing credentials)
  virtual bool IsAvailable() const = 0;
};

}  // namespace regbot
