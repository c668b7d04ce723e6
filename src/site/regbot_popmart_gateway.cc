#include "regbot_popmart_gateway.h"
#include "logger.h"
#include "regbot_text_utils.h"
#include <regex>

namespace regbot {

namespace {

const char kSessionSeparator[] = "||@@||";

// Attribute value in double quotes, single quotes or unquoted
std::string AttributeValue(const std::string& attrs, const std::string& name) {
  std::regex attr_regex("\\b" + name + R"re(\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+)))re",
                        std::regex::icase);
  std::smatch m;
  if (!std::regex_search(attrs, m, attr_regex)) {
    return "";
  }
  for (size_t i = 1; i <= 3; ++i) {
    if (m[i].matched) {
      return DecodeHtmlEntities(m[i].str());
    }
  }
  return "";
}

}  // namespace

PopmartSiteGateway::PopmartSiteGateway(const PopmartGatewayConfig& config,
                                       std::shared_ptr<HttpClient> http)
    : config_(config), http_(std::move(http)) {
  LOG_DEBUG("PopmartGateway", "Initialized for " + config_.base_url);
}

std::vector<HtmlOption> PopmartSiteGateway::ParseOptions(const std::string& html) {
  std::vector<HtmlOption> options;

  // Option text runs to the next tag, closing </option> is optional in HTML
  static const std::regex option_regex(R"(<option\b([^>]*)>([^<]*))", std::regex::icase);
  auto begin = std::sregex_iterator(html.begin(), html.end(), option_regex);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    HtmlOption option;
    option.value = Trim(AttributeValue((*it)[1].str(), "value"));
    option.text = Trim(DecodeHtmlEntities((*it)[2].str()));
    options.push_back(option);
  }
  return options;
}

std::vector<HtmlOption> PopmartSiteGateway::ParseSelectOptions(const std::string& html,
                                                               const std::string& select_id) {
  static const std::regex select_regex(R"(<select\b([^>]*)>([\s\S]*?)</select>)",
                                       std::regex::icase);
  auto begin = std::sregex_iterator(html.begin(), html.end(), select_regex);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    if (AttributeValue((*it)[1].str(), "id") == select_id) {
      return ParseOptions((*it)[2].str());
    }
  }
  return {};
}

std::optional<std::string> PopmartSiteGateway::ParseFirstImageSrc(const std::string& html) {
  static const std::regex img_regex(R"(<img\b([^>]*)>)", std::regex::icase);
  std::smatch m;
  if (!std::regex_search(html, m, img_regex)) {
    return std::nullopt;
  }
  std::string src = Trim(AttributeValue(m[1].str(), "src"));
  if (src.empty()) {
    return std::nullopt;
  }
  return src;
}

std::string PopmartSiteGateway::ResolveUrl(const std::string& base_url, const std::string& src) {
  if (StartsWith(src, "http://") || StartsWith(src, "https://")) {
    return src;
  }
  // Relative sources look like "./Captcha.aspx?..." or "/Captcha.aspx?..."
  size_t start = src.find_first_not_of("./");
  std::string path = start == std::string::npos ? "" : src.substr(start);
  return base_url + "/" + path;
}

std::vector<Session> PopmartSiteGateway::ParseSessions(const std::string& raw) {
  std::string trimmed = Trim(raw);
  std::string options_html = trimmed.substr(0, trimmed.find(kSessionSeparator));

  std::vector<Session> sessions;
  for (const auto& option : ParseOptions(options_html)) {
    // Placeholder entries carry no value
    if (option.value.empty()) {
      continue;
    }
    sessions.push_back({option.value, option.text});
  }
  return sessions;
}

std::string PopmartSiteGateway::FetchFormPage() {
  HttpResponse response = http_->GetWithRetry(config_.base_url + config_.form_path);
  return response.body;
}

std::vector<std::string> PopmartSiteGateway::ExtractSalesDayLabels(const std::string& html) {
  std::vector<std::string> labels;
  for (const auto& option : ParseSelectOptions(html, config_.day_select_id)) {
    if (!option.text.empty() && !option.value.empty()) {
      labels.push_back(option.text);
    }
  }
  return labels;
}

std::optional<std::string> PopmartSiteGateway::MapLabelToId(const std::string& html,
                                                            const std::string& label) {
  for (const auto& option : ParseSelectOptions(html, config_.day_select_id)) {
    if (option.text == label && !option.value.empty()) {
      return option.value;
    }
  }
  return std::nullopt;
}

std::vector<Session> PopmartSiteGateway::LoadSessions(const std::string& day_id) {
  HttpResponse response = http_->GetWithRetry(
      AjaxUrl(), {{"Action", "LoadPhien"}, {"idNgayBanHang", day_id}});
  std::vector<Session> sessions = ParseSessions(response.body);
  LOG_DEBUG("PopmartGateway", "Day " + day_id + ": " + std::to_string(sessions.size()) + " sessions");
  return sessions;
}

std::optional<std::string> PopmartSiteGateway::FetchCaptchaChallengeRef() {
  HttpResponse response = http_->GetWithRetry(AjaxUrl(), {{"Action", "LoadCaptcha"}});
  auto src = ParseFirstImageSrc(response.body);
  if (!src) {
    LOG_WARN("PopmartGateway", "Captcha response carried no image");
    return std::nullopt;
  }
  return ResolveUrl(config_.base_url, *src);
}

std::vector<uint8_t> PopmartSiteGateway::DownloadImage(const std::string& ref) {
  HttpResponse response = http_->GetWithRetry(ref);
  return std::vector<uint8_t>(response.body.begin(), response.body.end());
}

std::string PopmartSiteGateway::SubmitRegistration(const FormFields& fields) {
  HttpParams params(fields.begin(), fields.end());
  HttpResponse response = http_->GetWithRetry(AjaxUrl(), params);
  return Trim(response.body);
}

}  // namespace regbot
