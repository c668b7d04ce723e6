#pragma once

#include <memory>
#include <string>
#include <vector>
#include "regbot_http_client.h"
#include "regbot_site_gateway.h"

namespace regbot {

struct HtmlOption {
  std::string value;
  std::string text;
};

// Gateway settings, filled from RegbotConfig
struct PopmartGatewayConfig {
  std::string base_url = "https://popmartstt.com";
  std::string form_path = "/popmart";
  std::string ajax_path = "/Ajax.aspx";
  std::string day_select_id = "slNgayBanHang";
};

/**
 * PopmartSiteGateway - HTTP + HTML gateway for the Pop Mart sales-session form
 *
 * Endpoints:
 * - GET {form_path}                                   form page with the day <select>
 * - GET {ajax_path}?Action=LoadPhien&idNgayBanHang=   session <option>s, "||@@||" separated
 * - GET {ajax_path}?Action=LoadCaptcha                fragment holding the captcha <img>
 * - GET {ajax_path}?Action=DangKyThamDu&...           registration, "!!!True|~~|" on success
 *
 * Every network call goes through HttpClient::GetWithRetry. A gateway is one
 * cookie session; captchas it fetches can only be submitted through it.
 */
class PopmartSiteGateway : public ISiteGateway {
public:
  PopmartSiteGateway(const PopmartGatewayConfig& config, std::shared_ptr<HttpClient> http);

  std::string FetchFormPage() override;
  std::vector<std::string> ExtractSalesDayLabels(const std::string& html) override;
  std::optional<std::string> MapLabelToId(const std::string& html,
                                          const std::string& label) override;
  std::vector<Session> LoadSessions(const std::string& day_id) override;
  std::optional<std::string> FetchCaptchaChallengeRef() override;
  std::vector<uint8_t> DownloadImage(const std::string& ref) override;
  std::string SubmitRegistration(const FormFields& fields) override;

  // HTML helpers, exposed for tests

  // Options of the <select> with the given id; empty when it is missing
  static std::vector<HtmlOption> ParseSelectOptions(const std::string& html,
                                                    const std::string& select_id);
  // All <option>s of a fragment
  static std::vector<HtmlOption> ParseOptions(const std::string& html);
  static std::optional<std::string> ParseFirstImageSrc(const std::string& html);
  static std::string ResolveUrl(const std::string& base_url, const std::string& src);
  // Session options from a LoadPhien response
  static std::vector<Session> ParseSessions(const std::string& raw);

private:
  std::string AjaxUrl() const { return config_.base_url + config_.ajax_path; }

  PopmartGatewayConfig config_;
  std::shared_ptr<HttpClient> http_;
};

}  // namespace regbot
