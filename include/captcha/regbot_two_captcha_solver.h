#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "regbot_captcha_solver.h"
#include "regbot_http_client.h"

namespace regbot {

struct TwoCaptchaConfig {
  std::string api_key;
  std::string base_url = "https://2captcha.com";
  std::chrono::seconds soft_timeout{120};
  std::chrono::seconds poll_interval{5};
};

/**
 * TwoCaptchaSolver - Image captcha solving through the 2Captcha HTTP API
 *
 * Flow:
 * 1. POST in.php {key, method=base64, body, json=1} -> {"status":1,"request":"<id>"}
 * 2. Every poll_interval: GET res.php?key&action=get&id&json=1
 *    until {"status":1,"request":"<answer>"} or soft_timeout elapses
 */
class TwoCaptchaSolver : public ICaptchaSolver {
public:
  TwoCaptchaSolver(const TwoCaptchaConfig& config, std::shared_ptr<HttpClient> http);

  std::optional<std::string> Solve(const std::vector<uint8_t>& image) override;
  bool IsAvailable() const override { return !config_.api_key.empty(); }

  // Parses an in.php / res.php JSON reply; nullopt unless status == 1
  static std::optional<std::string> ParseReply(const std::string& body);

private:
  std::optional<std::string> Submit(const std::vector<uint8_t>& image);
  std::optional<std::string> PollResult(const std::string& captcha_id);

  TwoCaptchaConfig config_;
  std::shared_ptr<HttpClient> http_;
};

}  // namespace regbot
