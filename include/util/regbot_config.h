#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace regbot {

// Rows-to-days assignment policy
enum class AssignmentMode {
  ROUND_ROBIN,  // day i receives row (i mod row_count)
  ALL_ROWS      // every day receives every row
};

// What happens to a day whose worker failed
enum class DayRetryPolicy {
  NEVER_RETRY,      // attempted days are always Completed
  RETRY_ON_FAILURE  // failed days return to Pending and may be claimed again
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct RegbotConfig {
  // Target site
  std::string base_url = "https://popmartstt.com";
  std::string form_path = "/popmart";
  std::string ajax_path = "/Ajax.aspx";
  int request_timeout_sec = 30;
  int http_max_tries = 3;          // per gateway call
  int http_backoff_min_ms = 1000;  // first retry delay, doubled per retry
  int http_backoff_max_ms = 10000;

  // Scheduling
  int max_day_workers = 10;
  AssignmentMode assignment_mode = AssignmentMode::ROUND_ROBIN;
  DayRetryPolicy day_retry_policy = DayRetryPolicy::NEVER_RETRY;

  // Captcha
  bool use_2captcha = false;
  std::string two_captcha_api_key;
  std::string two_captcha_base_url = "https://2captcha.com";
  int captcha_soft_timeout_sec = 120;
  int captcha_poll_interval_sec = 5;
  int captcha_max_attempts = 4;
  bool manual_fallback_on_exhaustion = false;

  // Telegram
  std::string telegram_bot_token;
  std::string telegram_api_url = "https://api.telegram.org";
  int telegram_poll_timeout_sec = 30;
  std::vector<std::string> admins;  // empty = everyone may use the bot

  // Logging
  std::string log_file;
  bool verbose = false;
};

/**
 * Load configuration from a JSON file on top of the current values.
 * Keys mirror the struct fields (e.g. "base_url", "captcha_max_attempts").
 * Throws ConfigError when the file is unreadable or malformed.
 */
void LoadConfigFile(RegbotConfig& config, const std::string& file_path);

/**
 * Load configuration from environment variables on top of the current values.
 *
 * Environment variables:
 *   BASE_URL               - Target site base URL (trailing '/' stripped)
 *   TELEGRAM_BOT_TOKEN     - Bot API token (required to run the bot)
 *   TELEGRAM_API_URL       - Bot API endpoint (default: https://api.telegram.org)
 *   ADMINS                 - Comma-separated user ids allowed to use the bot
 *   REQUEST_TIMEOUT        - HTTP timeout in seconds (default: 30)
 *   MAX_WORKERS            - Max concurrent day workers (default: 10)
 *   USE_2CAPTCHA           - "1" enables automatic solving (default: 0)
 *   TWO_CAPTCHA_API_KEY    - 2Captcha account key
 *   CAPTCHA_SOFT_TIMEOUT   - Solver soft timeout in seconds (default: 120)
 *   CAPTCHA_POLL_INTERVAL  - Solver poll interval in seconds (default: 5)
 *   CAPTCHA_MAX_TRIES      - Attempts per row (default: 4)
 *   MANUAL_FALLBACK        - "1" asks the operator after exhausted auto attempts
 *   ASSIGNMENT_MODE        - "round-robin" or "all-rows"
 *   DAY_RETRY_POLICY       - "never-retry" or "retry-on-failure"
 *   REGBOT_LOG_FILE        - Append logs to this file
 *
 * Throws ConfigError on unparsable numeric or enum values.
 */
void LoadConfigFromEnvironment(RegbotConfig& config);

// Throws ConfigError describing the first invalid setting
void ValidateConfig(const RegbotConfig& config);

// Logs the effective configuration with secrets masked
void PrintConfig(const RegbotConfig& config);

// True when a solver is both enabled and has credentials
bool AutoSolveEnabled(const RegbotConfig& config);

AssignmentMode ParseAssignmentMode(const std::string& value);
DayRetryPolicy ParseDayRetryPolicy(const std::string& value);
std::string AssignmentModeToString(AssignmentMode mode);
std::string DayRetryPolicyToString(DayRetryPolicy policy);

}  // namespace regbot
