#include <gtest/gtest.h>
#include <memory>
#include "regbot_popmart_gateway.h"

using namespace regbot;

namespace {

const char kFormHtml[] = R"(
<html><body>
<select id="slOther"><option value="9">24/12/2024</option></select>
<select class="form-control" id="slNgayBanHang" name="ngay">
  <option value="">-- Chon ngay --</option>
  <option value="41">24/12/2024</option>
  <option value='42' selected>25/12/2024</option>
  <option value="">26/12/2024</option>
  <option value=43>27/12/2024
</select>
</body></html>)";

}  // namespace

TEST(PopmartGatewayParseTest, SalesDayLabelsSkipPlaceholders) {
  PopmartSiteGateway gateway(PopmartGatewayConfig(), std::make_shared<HttpClient>());

  auto labels = gateway.ExtractSalesDayLabels(kFormHtml);
  EXPECT_EQ(labels, (std::vector<std::string>{"24/12/2024", "25/12/2024", "27/12/2024"}));
}

TEST(PopmartGatewayParseTest, LabelMapsToItsOptionValue) {
  PopmartSiteGateway gateway(PopmartGatewayConfig(), std::make_shared<HttpClient>());

  EXPECT_EQ(gateway.MapLabelToId(kFormHtml, "24/12/2024"), std::optional<std::string>("41"));
  EXPECT_EQ(gateway.MapLabelToId(kFormHtml, "27/12/2024"), std::optional<std::string>("43"));
  EXPECT_FALSE(gateway.MapLabelToId(kFormHtml, "26/12/2024").has_value());
  EXPECT_FALSE(gateway.MapLabelToId(kFormHtml, "01/01/2025").has_value());
  EXPECT_FALSE(gateway.MapLabelToId("<html></html>", "24/12/2024").has_value());
}

TEST(PopmartGatewayParseTest, SessionsComeFromTheFirstResponsePart) {
  std::string raw =
      "  <option value=\"\">Chon phien</option><option value=\"101\">09:00 - 11:00</option>"
      "<option value=\"102\">Phi&#234;n 2</option>||@@||<option value=\"999\">x</option>  ";

  auto sessions = PopmartSiteGateway::ParseSessions(raw);
  ASSERT_EQ(sessions.size(), 2u);
  EXPECT_EQ(sessions[0].id, "101");
  EXPECT_EQ(sessions[0].label, "09:00 - 11:00");
  EXPECT_EQ(sessions[1].label, "Phi\xC3\xAAn 2");
  EXPECT_TRUE(PopmartSiteGateway::ParseSessions("||@@||").empty());
}

TEST(PopmartGatewayParseTest, CaptchaImageSource) {
  EXPECT_EQ(PopmartSiteGateway::ParseFirstImageSrc(
                "<div><IMG alt=\"c\" SRC=\"./Captcha.aspx?t=1&amp;k=2\"/></div>"),
            std::optional<std::string>("./Captcha.aspx?t=1&k=2"));
  EXPECT_FALSE(PopmartSiteGateway::ParseFirstImageSrc("<div>no image</div>").has_value());
  EXPECT_FALSE(PopmartSiteGateway::ParseFirstImageSrc("<img alt=\"x\">").has_value());
}

TEST(PopmartGatewayParseTest, RelativeSourcesJoinTheBaseUrl) {
  const std::string base = "https://popmartstt.com";
  EXPECT_EQ(PopmartSiteGateway::ResolveUrl(base, "./Captcha.aspx?x=1"),
            "https://popmartstt.com/Captcha.aspx?x=1");
  EXPECT_EQ(PopmartSiteGateway::ResolveUrl(base, "/img/c.png"), "https://popmartstt.com/img/c.png");
  EXPECT_EQ(PopmartSiteGateway::ResolveUrl(base, "c.png"), "https://popmartstt.com/c.png");
  EXPECT_EQ(PopmartSiteGateway::ResolveUrl(base, "https://cdn.test/c.png"), "https://cdn.test/c.png");
}
