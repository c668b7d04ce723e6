#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace regbot {

// One inbound message from the operator channel
struct InboundMessage {
  int64_t update_id = 0;
  std::string channel_id;                      // chat the message came from
  std::string sender_id;                       // user who sent it
  int64_t message_id = 0;
  std::string text;                            // empty for documents
  std::optional<int64_t> reply_to_message_id;  // set when replying to a message
  std::optional<std::string> document_file_id;
  std::string document_name;
};

/**
 * IMessenger - Operator channel used for status reports and manual captchas
 *
 * Send methods log delivery failures and do not throw. They are called
 * concurrently by day workers.
 */
class IMessenger {
public:
  virtual ~IMessenger() = default;

  virtual void SendText(const std::string& channel_id, const std::string& text) = 0;

  /**
   * Send an image with a caption
   * @return Message id of the delivered photo, or 0 when delivery failed
   */
  virtual int64_t SendImage(const std::string& channel_id,
                            const std::vector<uint8_t>& image,
                            const std::string& caption) = 0;

  // Inbound messages received since the previous call, waiting up to the
  // implementation's poll timeout. Empty on timeout or transport error.
  virtual std::vector<InboundMessage> PollUpdates() = 0;

  // Contents of an uploaded document. Throws std::runtime_error on failure.
  virtual std::vector<uint8_t> DownloadDocument(const std::string& file_id) = 0;
};

}  // namespace regbot
