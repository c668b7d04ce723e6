#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "regbot_http_client.h"
#include "regbot_messenger.h"

namespace regbot {

struct TelegramConfig {
  std::string bot_token;
  std::string api_url = "https://api.telegram.org";
  int poll_timeout_sec = 30;  // getUpdates long-poll wait
};

/**
 * TelegramMessenger - Bot API client (sendMessage, sendPhoto, getUpdates, getFile)
 *
 * The HttpClient timeout must exceed poll_timeout_sec or every long poll
 * ends as a transport error.
 */
class TelegramMessenger : public IMessenger {
public:
  TelegramMessenger(const TelegramConfig& config, std::shared_ptr<HttpClient> http);

  void SendText(const std::string& channel_id, const std::string& text) override;
  int64_t SendImage(const std::string& channel_id,
                    const std::vector<uint8_t>& image,
                    const std::string& caption) override;
  std::vector<InboundMessage> PollUpdates() override;
  std::vector<uint8_t> DownloadDocument(const std::string& file_id) override;

  // Updates of a getUpdates reply. Updates without a usable message come back
  // with an empty channel_id so the caller can still advance its offset.
  // Throws std::runtime_error when the reply is not ok.
  static std::vector<InboundMessage> ParseUpdates(const std::string& body);

  // result.message_id of a send reply, 0 when absent or not ok
  static int64_t ParseMessageId(const std::string& body);

  static constexpr size_t kMaxTextBytes = 4096;
  static constexpr size_t kMaxCaptionBytes = 1024;

private:
  std::string MethodUrl(const std::string& method) const;

  TelegramConfig config_;
  std::shared_ptr<HttpClient> http_;
  std::atomic<int64_t> next_offset_{0};
};

}  // namespace regbot
