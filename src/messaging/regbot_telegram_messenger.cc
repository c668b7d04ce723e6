#include "regbot_telegram_messenger.h"
#include "logger.h"
#include "regbot_text_utils.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace regbot {

namespace {

std::string IdToString(const json& value) {
  if (value.is_number_integer()) {
    return std::to_string(value.get<int64_t>());
  }
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return "";
}

// Telegram puts the failure reason in "description"
std::string DescribeFailure(const HttpResponse& response) {
  json reply = json::parse(response.body, nullptr, false);
  if (!reply.is_discarded() && reply.is_object() && reply.contains("description") &&
      reply["description"].is_string()) {
    return response.error + ": " + reply["description"].get<std::string>();
  }
  return response.error;
}

}  // namespace

TelegramMessenger::TelegramMessenger(const TelegramConfig& config,
                                     std::shared_ptr<HttpClient> http)
    : config_(config), http_(std::move(http)) {}

std::string TelegramMessenger::MethodUrl(const std::string& method) const {
  return config_.api_url + "/bot" + config_.bot_token + "/" + method;
}

void TelegramMessenger::SendText(const std::string& channel_id, const std::string& text) {
  HttpResponse response = http_->PostForm(MethodUrl("sendMessage"), {
      {"chat_id", channel_id},
      {"text", TruncateUtf8(text, kMaxTextBytes)},
  });
  if (!response.success) {
    LOG_WARN("Telegram", "sendMessage to " + channel_id + " failed: " + DescribeFailure(response));
  }
}

int64_t TelegramMessenger::SendImage(const std::string& channel_id,
                                     const std::vector<uint8_t>& image,
                                     const std::string& caption) {
  HttpFilePart photo;
  photo.field_name = "photo";
  photo.file_name = "captcha.png";
  photo.content_type = "image/png";
  photo.data = image;

  HttpResponse response = http_->PostMultipart(MethodUrl("sendPhoto"), {
      {"chat_id", channel_id},
      {"caption", TruncateUtf8(caption, kMaxCaptionBytes)},
  }, photo);

  if (!response.success) {
    LOG_WARN("Telegram", "sendPhoto to " + channel_id + " failed: " + DescribeFailure(response));
    return 0;
  }
  return ParseMessageId(response.body);
}

int64_t TelegramMessenger::ParseMessageId(const std::string& body) {
  json reply = json::parse(body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object() || !reply.value("ok", false)) {
    return 0;
  }
  auto result = reply.find("result");
  if (result == reply.end() || !result->is_object()) {
    return 0;
  }
  auto message_id = result->find("message_id");
  if (message_id == result->end() || !message_id->is_number_integer()) {
    return 0;
  }
  return message_id->get<int64_t>();
}

std::vector<InboundMessage> TelegramMessenger::ParseUpdates(const std::string& body) {
  json reply = json::parse(body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    throw std::runtime_error("getUpdates reply is not JSON");
  }
  if (!reply.value("ok", false) || !reply.contains("result") || !reply["result"].is_array()) {
    throw std::runtime_error("getUpdates failed: " + reply.value("description", std::string("no result")));
  }

  std::vector<InboundMessage> messages;
  for (const auto& update : reply["result"]) {
    if (!update.is_object() || !update.contains("update_id") ||
        !update["update_id"].is_number_integer()) {
      continue;
    }

    InboundMessage msg;
    msg.update_id = update["update_id"].get<int64_t>();

    auto message = update.find("message");
    if (message == update.end() || !message->is_object()) {
      // Still returned so the offset moves past it
      messages.push_back(msg);
      continue;
    }

    try {
      msg.message_id = message->value("message_id", static_cast<int64_t>(0));
      if (message->contains("chat") && (*message)["chat"].contains("id")) {
        msg.channel_id = IdToString((*message)["chat"]["id"]);
      }
      if (message->contains("from") && (*message)["from"].contains("id")) {
        msg.sender_id = IdToString((*message)["from"]["id"]);
      }
      msg.text = message->value("text", std::string());

      auto reply_to = message->find("reply_to_message");
      if (reply_to != message->end() && reply_to->is_object() && reply_to->contains("message_id")) {
        msg.reply_to_message_id = (*reply_to)["message_id"].get<int64_t>();
      }

      auto document = message->find("document");
      if (document != message->end() && document->is_object()) {
        msg.document_file_id = document->value("file_id", std::string());
        msg.document_name = document->value("file_name", std::string());
      }
    } catch (const json::exception& e) {
      // Kept without a channel so the offset still moves past it
      LOG_WARN("Telegram", "Skipping malformed update " + std::to_string(msg.update_id) + ": " +
               e.what());
      InboundMessage skipped;
      skipped.update_id = msg.update_id;
      msg = std::move(skipped);
    }

    messages.push_back(std::move(msg));
  }
  return messages;
}

std::vector<InboundMessage> TelegramMessenger::PollUpdates() {
  HttpParams params = {{"timeout", std::to_string(config_.poll_timeout_sec)}};
  int64_t offset = next_offset_.load();
  if (offset != 0) {
    params.emplace_back("offset", std::to_string(offset));
  }

  HttpResponse response = http_->Get(MethodUrl("getUpdates"), params);
  if (!response.success) {
    LOG_WARN("Telegram", "getUpdates failed: " + DescribeFailure(response));
    return {};
  }

  std::vector<InboundMessage> updates;
  try {
    updates = ParseUpdates(response.body);
  } catch (const std::exception& e) {
    LOG_WARN("Telegram", std::string("getUpdates reply rejected: ") + e.what());
    return {};
  }

  std::vector<InboundMessage> messages;
  for (auto& update : updates) {
    if (update.update_id >= next_offset_.load()) {
      next_offset_.store(update.update_id + 1);
    }
    if (!update.channel_id.empty()) {
      messages.push_back(std::move(update));
    }
  }
  return messages;
}

std::vector<uint8_t> TelegramMessenger::DownloadDocument(const std::string& file_id) {
  HttpResponse info = http_->Get(MethodUrl("getFile"), {{"file_id", file_id}});
  if (!info.success) {
    throw std::runtime_error("getFile failed: " + DescribeFailure(info));
  }

  json reply = json::parse(info.body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object() || !reply.value("ok", false) ||
      !reply.contains("result") ||
      !reply["result"].contains("file_path")) {
    throw std::runtime_error("getFile returned no file_path");
  }
  std::string file_path = reply["result"]["file_path"].get<std::string>();

  HttpResponse file = http_->Get(config_.api_url + "/file/bot" + config_.bot_token + "/" + file_path);
  if (!file.success) {
    throw std::runtime_error("file download failed: " + file.error);
  }
  return std::vector<uint8_t>(file.body.begin(), file.body.end());
}

}  // namespace regbot
