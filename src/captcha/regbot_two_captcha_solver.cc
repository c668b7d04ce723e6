#include "regbot_two_captcha_solver.h"
#include "logger.h"
#include "regbot_text_utils.h"
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace regbot {

TwoCaptchaSolver::TwoCaptchaSolver(const TwoCaptchaConfig& config,
                                   std::shared_ptr<HttpClient> http)
    : config_(config), http_(std::move(http)) {
  if (!IsAvailable()) {
    LOG_WARN("TwoCaptcha", "No API key configured, solver disabled");
  }
}

std::optional<std::string> TwoCaptchaSolver::ParseReply(const std::string& body) {
  json reply = json::parse(body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    return std::nullopt;
  }

  auto status = reply.find("status");
  auto request = reply.find("request");
  if (status == reply.end() || request == reply.end()) {
    return std::nullopt;
  }
  if (!status->is_number_integer() || status->get<int>() != 1) {
    return std::nullopt;
  }

  std::string value = request->is_string() ? request->get<std::string>() : request->dump();
  value = Trim(value);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> TwoCaptchaSolver::Submit(const std::vector<uint8_t>& image) {
  HttpResponse response = http_->PostForm(config_.base_url + "/in.php", {
      {"key", config_.api_key},
      {"method", "base64"},
      {"body", Base64Encode(image)},
      {"json", "1"},
  });

  if (!response.success) {
    LOG_WARN("TwoCaptcha", "in.php request failed: " + response.error);
    return std::nullopt;
  }

  auto captcha_id = ParseReply(response.body);
  if (!captcha_id) {
    LOG_WARN("TwoCaptcha", "in.php rejected the image: " + TruncateUtf8(response.body, 200));
  }
  return captcha_id;
}

std::optional<std::string> TwoCaptchaSolver::PollResult(const std::string& captcha_id) {
  auto deadline = std::chrono::steady_clock::now() + config_.soft_timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(config_.poll_interval);

    HttpResponse response = http_->Get(config_.base_url + "/res.php", {
        {"key", config_.api_key},
        {"action", "get"},
        {"id", captcha_id},
        {"json", "1"},
    });
    if (!response.success) {
      LOG_WARN("TwoCaptcha", "res.php request failed: " + response.error);
      return std::nullopt;
    }

    // {"status":0,"request":"CAPCHA_NOT_READY"} while the worker is busy
    auto answer = ParseReply(response.body);
    if (answer) {
      return answer;
    }
  }

  LOG_WARN("TwoCaptcha", "No answer for captcha " + captcha_id + " within " +
           std::to_string(config_.soft_timeout.count()) + "s");
  return std::nullopt;
}

std::optional<std::string> TwoCaptchaSolver::Solve(const std::vector<uint8_t>& image) {
  if (!IsAvailable()) {
    return std::nullopt;
  }
  if (image.empty()) {
    LOG_WARN("TwoCaptcha", "Empty captcha image");
    return std::nullopt;
  }

  auto captcha_id = Submit(image);
  if (!captcha_id) {
    return std::nullopt;
  }
  LOG_DEBUG("TwoCaptcha", "Submitted captcha, id=" + *captcha_id);
  return PollResult(*captcha_id);
}

}  // namespace regbot
