#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "regbot_site_gateway.h"
#include "regbot_types.h"

namespace regbot {

struct PendingCaptchaKey {
  std::string channel_id;
  std::string day_label;
  int row_index = 0;

  bool operator<(const PendingCaptchaKey& other) const {
    return std::tie(channel_id, day_label, row_index) <
           std::tie(other.channel_id, other.day_label, other.row_index);
  }
  bool operator==(const PendingCaptchaKey& other) const {
    return channel_id == other.channel_id && day_label == other.day_label &&
           row_index == other.row_index;
  }
};

// A registration waiting for the operator to type the captcha
struct PendingCaptchaTask {
  PendingCaptchaKey key;
  std::string day_id;
  std::string session_id;
  RegistrantRow row;
  int64_t prompt_message_id = 0;  // photo message the operator replies to, 0 if unknown
  std::shared_ptr<ISiteGateway> site;  // session the captcha was issued to
};

/**
 * PendingCaptchaStore - Manual captcha tasks awaiting an operator reply
 *
 * Every task is handed out at most once: each Pop* removes the task inside the
 * same critical section that found it. Tasks that never get a reply stay
 * until the process exits, there is no expiry.
 */
class PendingCaptchaStore {
public:
  PendingCaptchaStore() = default;

  PendingCaptchaStore(const PendingCaptchaStore&) = delete;
  PendingCaptchaStore& operator=(const PendingCaptchaStore&) = delete;

  // Inserts, replacing any task already stored under the same key
  void Put(const PendingCaptchaTask& task);

  // Pops the task whose prompt message is prompt_message_id in channel
  std::optional<PendingCaptchaTask> PopByPrompt(const std::string& channel_id,
                                                int64_t prompt_message_id);

  // Pops the first pending task of channel (ordered by day label, then row).
  // With several pending rows in one channel the operator cannot choose which
  // one a bare reply answers; replying to the captcha photo avoids this.
  std::optional<PendingCaptchaTask> PopByChannel(const std::string& channel_id);

  std::vector<PendingCaptchaKey> PendingFor(const std::string& channel_id) const;
  size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::map<PendingCaptchaKey, PendingCaptchaTask> tasks_;
};

}  // namespace regbot
