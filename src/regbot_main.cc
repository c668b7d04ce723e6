#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "logger.h"
#include "regbot_config.h"
#include "regbot_http_client.h"
#include "regbot_popmart_gateway.h"
#include "regbot_two_captcha_solver.h"
#include "regbot_telegram_messenger.h"
#include "regbot_pending_captcha_store.h"
#include "regbot_day_registry.h"
#include "regbot_day_scheduler.h"
#include "regbot_captcha_attempt_loop.h"
#include "regbot_registration_worker.h"
#include "regbot_registration_bot.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleSignal(int /*signal*/) {
  g_stop.store(true);
}

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config FILE         JSON config file, applied before the environment\n";
  std::cout << "  --log-file FILE       Also append logs to FILE\n";
  std::cout << "  --max-workers N       Max concurrent day workers\n";
  std::cout << "  --verbose             Enable debug logging\n";
  std::cout << "  --help                Show this help message\n";
  std::cout << "\n";
  std::cout << "Environment:\n";
  std::cout << "  TELEGRAM_BOT_TOKEN, BASE_URL, ADMINS, REQUEST_TIMEOUT, MAX_WORKERS,\n";
  std::cout << "  USE_2CAPTCHA, TWO_CAPTCHA_API_KEY, CAPTCHA_SOFT_TIMEOUT, CAPTCHA_POLL_INTERVAL,\n";
  std::cout << "  CAPTCHA_MAX_TRIES, MANUAL_FALLBACK, ASSIGNMENT_MODE, DAY_RETRY_POLICY,\n";
  std::cout << "  REGBOT_LOG_FILE\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_file;
  std::string log_file;
  int max_workers = 0;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else if (arg == "--config" && i + 1 < argc) {
      config_file = argv[++i];
    } else if (arg == "--log-file" && i + 1 < argc) {
      log_file = argv[++i];
    } else if (arg == "--max-workers" && i + 1 < argc) {
      max_workers = std::atoi(argv[++i]);
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  regbot::RegbotConfig config;
  try {
    if (!config_file.empty()) {
      regbot::LoadConfigFile(config, config_file);
    }
    regbot::LoadConfigFromEnvironment(config);
    if (!log_file.empty()) config.log_file = log_file;
    if (max_workers > 0) config.max_day_workers = max_workers;
    if (verbose) config.verbose = true;

    regbot::ValidateConfig(config);
    if (config.telegram_bot_token.empty()) {
      throw regbot::ConfigError("TELEGRAM_BOT_TOKEN is required");
    }
  } catch (const regbot::ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }

  if (config.log_file.empty()) {
    regbot::Logger::Init();
  } else {
    regbot::Logger::Init(config.log_file);
  }
  regbot::Logger::SetLevel(config.verbose ? regbot::DEBUG : regbot::INFO);
  regbot::PrintConfig(config);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  regbot::HttpClient::GlobalInit();
  int exit_code = 0;

  try {
    regbot::HttpClientOptions site_options;
    site_options.timeout_sec = config.request_timeout_sec;
    site_options.max_tries = config.http_max_tries;
    site_options.backoff_min_ms = config.http_backoff_min_ms;
    site_options.backoff_max_ms = config.http_backoff_max_ms;

    regbot::HttpClientOptions api_options;
    api_options.timeout_sec = config.request_timeout_sec;
    api_options.share_cookies = false;
    auto solver_http = std::make_shared<regbot::HttpClient>(api_options);

    // Long polls hold the connection for telegram_poll_timeout_sec
    api_options.timeout_sec = config.telegram_poll_timeout_sec + config.request_timeout_sec;
    auto telegram_http = std::make_shared<regbot::HttpClient>(api_options);

    regbot::PopmartGatewayConfig gateway_config;
    gateway_config.base_url = config.base_url;
    gateway_config.form_path = config.form_path;
    gateway_config.ajax_path = config.ajax_path;
    // The site ties each captcha to the cookie session that requested it,
    // so every day run and every operator prompt gets its own session
    regbot::SiteSessionFactory open_site_session = [&gateway_config, &site_options]() {
      return std::make_shared<regbot::PopmartSiteGateway>(
          gateway_config, std::make_shared<regbot::HttpClient>(site_options));
    };
    std::shared_ptr<regbot::ISiteGateway> bot_site = open_site_session();

    std::unique_ptr<regbot::TwoCaptchaSolver> solver;
    if (regbot::AutoSolveEnabled(config)) {
      regbot::TwoCaptchaConfig solver_config;
      solver_config.api_key = config.two_captcha_api_key;
      solver_config.base_url = config.two_captcha_base_url;
      solver_config.soft_timeout = std::chrono::seconds(config.captcha_soft_timeout_sec);
      solver_config.poll_interval = std::chrono::seconds(config.captcha_poll_interval_sec);
      solver = std::make_unique<regbot::TwoCaptchaSolver>(solver_config, solver_http);
    }

    regbot::TelegramConfig telegram_config;
    telegram_config.bot_token = config.telegram_bot_token;
    telegram_config.api_url = config.telegram_api_url;
    telegram_config.poll_timeout_sec = config.telegram_poll_timeout_sec;
    regbot::TelegramMessenger messenger(telegram_config, telegram_http);

    regbot::PendingCaptchaStore pending;
    regbot::DayRegistry registry(config.day_retry_policy);

    regbot::AttemptLoopConfig loop_config;
    loop_config.max_attempts = config.captcha_max_attempts;
    loop_config.auto_solve = solver != nullptr;
    loop_config.manual_fallback_on_exhaustion = config.manual_fallback_on_exhaustion;

    regbot::DayRunner run_day = [&](const std::string& day_label,
                                    const std::vector<regbot::RegistrantRow>& rows,
                                    const std::string& channel_id) {
      std::shared_ptr<regbot::ISiteGateway> day_site = open_site_session();
      regbot::CaptchaAttemptLoop loop(day_site, solver.get(), messenger, pending, loop_config,
                                      open_site_session);
      regbot::RegistrationWorker worker(*day_site, loop, messenger, channel_id);
      return worker.Run(day_label, rows);
    };

    regbot::DayScheduler scheduler(registry, static_cast<size_t>(config.max_day_workers), run_day);
    regbot::CaptchaAttemptLoop resume_loop(bot_site, solver.get(), messenger, pending, loop_config);

    regbot::BotOptions bot_options;
    bot_options.admins = config.admins;
    bot_options.assignment_mode = config.assignment_mode;
    bot_options.max_day_workers = config.max_day_workers;
    regbot::RegistrationBot bot(bot_options, messenger, *bot_site, registry, scheduler, pending,
                                resume_loop);

    LOG_INFO("Main", "regbot started");
    bot.Run(g_stop);

    LOG_INFO("Main", "Waiting for " + std::to_string(scheduler.ActiveDayCount()) +
             " running day tasks");
    scheduler.Shutdown();
    bot.DeliverFinishedBatches();
  } catch (const std::exception& e) {
    LOG_ERROR("Main", std::string("Fatal: ") + e.what());
    exit_code = 1;
  }

  regbot::HttpClient::GlobalCleanup();
  LOG_INFO("Main", "regbot stopped");
  return exit_code;
}
