#include "regbot_pending_captcha_store.h"
#include "logger.h"

namespace regbot {

void PendingCaptchaStore::Put(const PendingCaptchaTask& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = tasks_.insert_or_assign(task.key, task);
  (void)it;
  if (!inserted) {
    LOG_INFO("PendingCaptcha", "Replaced pending task for day " + task.key.day_label +
             " row " + std::to_string(task.key.row_index + 1));
  }
}

std::optional<PendingCaptchaTask> PendingCaptchaStore::PopByPrompt(const std::string& channel_id,
                                                                   int64_t prompt_message_id) {
  if (prompt_message_id == 0) {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
    if (it->first.channel_id == channel_id && it->second.prompt_message_id == prompt_message_id) {
      PendingCaptchaTask task = std::move(it->second);
      tasks_.erase(it);
      return task;
    }
  }
  return std::nullopt;
}

std::optional<PendingCaptchaTask> PendingCaptchaStore::PopByChannel(const std::string& channel_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Keys sort by channel first, so the first key >= {channel} is the channel's first task
  auto it = tasks_.lower_bound(PendingCaptchaKey{channel_id, "", 0});
  if (it == tasks_.end() || it->first.channel_id != channel_id) {
    return std::nullopt;
  }

  PendingCaptchaTask task = std::move(it->second);
  tasks_.erase(it);
  return task;
}

std::vector<PendingCaptchaKey> PendingCaptchaStore::PendingFor(const std::string& channel_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PendingCaptchaKey> keys;
  for (auto it = tasks_.lower_bound(PendingCaptchaKey{channel_id, "", 0});
       it != tasks_.end() && it->first.channel_id == channel_id; ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

size_t PendingCaptchaStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

}  // namespace regbot
