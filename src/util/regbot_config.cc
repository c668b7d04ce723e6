#include "regbot_config.h"
#include "logger.h"
#include "regbot_text_utils.h"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace regbot {

namespace {

const char* GetEnv(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

int ParseInt(const std::string& name, const std::string& value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(Trim(value), &consumed);
    if (consumed != Trim(value).size()) {
      throw ConfigError(name + " is not an integer: " + value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigError(name + " is not an integer: " + value);
  }
}

bool ParseFlag(const std::string& value) {
  std::string v = ToLower(Trim(value));
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string StripTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

std::vector<std::string> ParseList(const std::string& value) {
  std::vector<std::string> out;
  for (const auto& item : Split(value, ',')) {
    std::string trimmed = Trim(item);
    if (!trimmed.empty()) {
      out.push_back(trimmed);
    }
  }
  return out;
}

std::string Mask(const std::string& secret) {
  if (secret.empty()) return "(unset)";
  if (secret.size() <= 6) return "***";
  return secret.substr(0, 3) + "***" + secret.substr(secret.size() - 2);
}

template <typename T>
void ReadKey(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

}  // namespace

AssignmentMode ParseAssignmentMode(const std::string& value) {
  std::string v = ToLower(Trim(value));
  if (v == "round-robin" || v == "round_robin") return AssignmentMode::ROUND_ROBIN;
  if (v == "all-rows" || v == "all_rows" || v == "all") return AssignmentMode::ALL_ROWS;
  throw ConfigError("Unknown assignment mode: " + value);
}

DayRetryPolicy ParseDayRetryPolicy(const std::string& value) {
  std::string v = ToLower(Trim(value));
  if (v == "never-retry" || v == "never_retry") return DayRetryPolicy::NEVER_RETRY;
  if (v == "retry-on-failure" || v == "retry_on_failure") return DayRetryPolicy::RETRY_ON_FAILURE;
  throw ConfigError("Unknown day retry policy: " + value);
}

std::string AssignmentModeToString(AssignmentMode mode) {
  return mode == AssignmentMode::ALL_ROWS ? "all-rows" : "round-robin";
}

std::string DayRetryPolicyToString(DayRetryPolicy policy) {
  return policy == DayRetryPolicy::RETRY_ON_FAILURE ? "retry-on-failure" : "never-retry";
}

void LoadConfigFile(RegbotConfig& config, const std::string& file_path) {
  std::ifstream in(file_path);
  if (!in) {
    throw ConfigError("Cannot open config file: " + file_path);
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("Malformed config file " + file_path + ": " + e.what());
  }
  if (!j.is_object()) {
    throw ConfigError("Config file must contain a JSON object: " + file_path);
  }

  try {
    ReadKey(j, "base_url", config.base_url);
    ReadKey(j, "form_path", config.form_path);
    ReadKey(j, "ajax_path", config.ajax_path);
    ReadKey(j, "request_timeout_sec", config.request_timeout_sec);
    ReadKey(j, "http_max_tries", config.http_max_tries);
    ReadKey(j, "http_backoff_min_ms", config.http_backoff_min_ms);
    ReadKey(j, "http_backoff_max_ms", config.http_backoff_max_ms);
    ReadKey(j, "max_day_workers", config.max_day_workers);
    ReadKey(j, "use_2captcha", config.use_2captcha);
    ReadKey(j, "two_captcha_api_key", config.two_captcha_api_key);
    ReadKey(j, "two_captcha_base_url", config.two_captcha_base_url);
    ReadKey(j, "captcha_soft_timeout_sec", config.captcha_soft_timeout_sec);
    ReadKey(j, "captcha_poll_interval_sec", config.captcha_poll_interval_sec);
    ReadKey(j, "captcha_max_attempts", config.captcha_max_attempts);
    ReadKey(j, "manual_fallback_on_exhaustion", config.manual_fallback_on_exhaustion);
    ReadKey(j, "telegram_bot_token", config.telegram_bot_token);
    ReadKey(j, "telegram_api_url", config.telegram_api_url);
    ReadKey(j, "telegram_poll_timeout_sec", config.telegram_poll_timeout_sec);
    ReadKey(j, "admins", config.admins);
    ReadKey(j, "log_file", config.log_file);
    ReadKey(j, "verbose", config.verbose);

    if (j.contains("assignment_mode")) {
      config.assignment_mode = ParseAssignmentMode(j["assignment_mode"].get<std::string>());
    }
    if (j.contains("day_retry_policy")) {
      config.day_retry_policy = ParseDayRetryPolicy(j["day_retry_policy"].get<std::string>());
    }
  } catch (const json::type_error& e) {
    throw ConfigError("Wrong value type in " + file_path + ": " + e.what());
  }

  config.base_url = StripTrailingSlash(config.base_url);
  LOG_INFO("Config", "Loaded config file: " + file_path);
}

void LoadConfigFromEnvironment(RegbotConfig& config) {
  if (const char* v = GetEnv("BASE_URL")) config.base_url = StripTrailingSlash(v);
  if (const char* v = GetEnv("TELEGRAM_BOT_TOKEN")) config.telegram_bot_token = Trim(v);
  if (const char* v = GetEnv("TELEGRAM_API_URL")) config.telegram_api_url = StripTrailingSlash(v);
  if (const char* v = GetEnv("ADMINS")) config.admins = ParseList(v);
  if (const char* v = GetEnv("REQUEST_TIMEOUT")) config.request_timeout_sec = ParseInt("REQUEST_TIMEOUT", v);
  if (const char* v = GetEnv("MAX_WORKERS")) config.max_day_workers = ParseInt("MAX_WORKERS", v);
  if (const char* v = GetEnv("USE_2CAPTCHA")) config.use_2captcha = ParseFlag(v);
  if (const char* v = GetEnv("TWO_CAPTCHA_API_KEY")) config.two_captcha_api_key = Trim(v);
  if (const char* v = GetEnv("CAPTCHA_SOFT_TIMEOUT")) {
    config.captcha_soft_timeout_sec = ParseInt("CAPTCHA_SOFT_TIMEOUT", v);
  }
  if (const char* v = GetEnv("CAPTCHA_POLL_INTERVAL")) {
    config.captcha_poll_interval_sec = ParseInt("CAPTCHA_POLL_INTERVAL", v);
  }
  if (const char* v = GetEnv("CAPTCHA_MAX_TRIES")) {
    config.captcha_max_attempts = ParseInt("CAPTCHA_MAX_TRIES", v);
  }
  if (const char* v = GetEnv("MANUAL_FALLBACK")) config.manual_fallback_on_exhaustion = ParseFlag(v);
  if (const char* v = GetEnv("ASSIGNMENT_MODE")) config.assignment_mode = ParseAssignmentMode(v);
  if (const char* v = GetEnv("DAY_RETRY_POLICY")) config.day_retry_policy = ParseDayRetryPolicy(v);
  if (const char* v = GetEnv("REGBOT_LOG_FILE")) config.log_file = v;
}

void ValidateConfig(const RegbotConfig& config) {
  if (config.base_url.empty()) {
    throw ConfigError("BASE_URL must not be empty");
  }
  if (!StartsWith(config.base_url, "http://") && !StartsWith(config.base_url, "https://")) {
    throw ConfigError("BASE_URL must start with http:// or https://: " + config.base_url);
  }
  if (config.request_timeout_sec <= 0) {
    throw ConfigError("REQUEST_TIMEOUT must be positive");
  }
  if (config.http_max_tries < 1) {
    throw ConfigError("http_max_tries must be at least 1");
  }
  if (config.max_day_workers < 1) {
    throw ConfigError("MAX_WORKERS must be at least 1");
  }
  if (config.captcha_max_attempts < 1) {
    throw ConfigError("CAPTCHA_MAX_TRIES must be at least 1");
  }
  if (config.captcha_poll_interval_sec <= 0 || config.captcha_soft_timeout_sec <= 0) {
    throw ConfigError("Captcha poll interval and soft timeout must be positive");
  }
  if (config.use_2captcha && config.two_captcha_api_key.empty()) {
    LOG_WARN("Config", "USE_2CAPTCHA=1 but TWO_CAPTCHA_API_KEY is empty, captchas go to the operator");
  }
}

void PrintConfig(const RegbotConfig& config) {
  LOG_INFO("Config", "base_url=" + config.base_url +
           " form_path=" + config.form_path +
           " ajax_path=" + config.ajax_path +
           " request_timeout=" + std::to_string(config.request_timeout_sec) + "s");
  LOG_INFO("Config", "max_day_workers=" + std::to_string(config.max_day_workers) +
           " assignment=" + AssignmentModeToString(config.assignment_mode) +
           " day_retry_policy=" + DayRetryPolicyToString(config.day_retry_policy));
  LOG_INFO("Config", std::string("use_2captcha=") + (config.use_2captcha ? "1" : "0") +
           " two_captcha_key=" + Mask(config.two_captcha_api_key) +
           " soft_timeout=" + std::to_string(config.captcha_soft_timeout_sec) + "s" +
           " poll_interval=" + std::to_string(config.captcha_poll_interval_sec) + "s" +
           " max_attempts=" + std::to_string(config.captcha_max_attempts) +
           " manual_fallback=" + (config.manual_fallback_on_exhaustion ? "1" : "0"));
  LOG_INFO("Config", "telegram_token=" + Mask(config.telegram_bot_token) +
           " admins=" + std::to_string(config.admins.size()));
}

bool AutoSolveEnabled(const RegbotConfig& config) {
  return config.use_2captcha && !config.two_captcha_api_key.empty();
}

}  // namespace regbot
