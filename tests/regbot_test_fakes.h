#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "regbot_captcha_solver.h"
#include "regbot_http_client.h"
#include "regbot_messenger.h"
#include "regbot_site_gateway.h"
#include "regbot_types.h"

namespace regbot {
namespace fakes {

// In-memory form site. Every captcha request yields a distinct reference so
// tests can tell fresh challenges apart.
class FakeSiteGateway : public ISiteGateway {
public:
  std::string FetchFormPage() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++form_fetches;
    if (fail_form_page) {
      throw NetworkError("form page unreachable");
    }
    return "<html>form</html>";
  }

  std::vector<std::string> ExtractSalesDayLabels(const std::string& /*html*/) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return day_labels;
  }

  std::optional<std::string> MapLabelToId(const std::string& /*html*/,
                                          const std::string& label) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = day_ids.find(label);
    if (it == day_ids.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<Session> LoadSessions(const std::string& day_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    session_loads.push_back(day_id);
    return sessions;
  }

  std::optional<std::string> FetchCaptchaChallengeRef() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++captcha_requests;
    if (captcha_network_errors > 0) {
      --captcha_network_errors;
      throw NetworkError("captcha endpoint timed out");
    }
    if (!captcha_available) {
      return std::nullopt;
    }
    std::string ref = "https://site.test/captcha/" + std::to_string(captcha_requests);
    captcha_refs.push_back(ref);
    return ref;
  }

  std::vector<uint8_t> DownloadImage(const std::string& ref) override {
    return std::vector<uint8_t>(ref.begin(), ref.end());
  }

  std::string SubmitRegistration(const FormFields& fields) override {
    std::lock_guard<std::mutex> lock(mutex_);
    submitted.push_back(fields);
    if (responder) {
      return responder(fields);
    }
    if (!responses.empty()) {
      std::string response = responses.front();
      responses.pop_front();
      return response;
    }
    return default_response;
  }

  std::vector<FormFields> Submitted() {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted;
  }

  // Names submitted so far, in order
  std::vector<std::string> SubmittedNames() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& fields : submitted) {
      names.push_back(fields.at("HoTen"));
    }
    return names;
  }

  std::vector<std::string> day_labels;
  std::map<std::string, std::string> day_ids;
  std::vector<Session> sessions = {{"101", "Session 1"}};
  bool fail_form_page = false;
  bool captcha_available = true;
  int captcha_network_errors = 0;
  std::deque<std::string> responses;
  std::string default_response = "!!!True|~~|";
  std::function<std::string(const FormFields&)> responder;

  int form_fetches = 0;
  int captcha_requests = 0;
  std::vector<std::string> captcha_refs;
  std::vector<std::string> session_loads;
  std::vector<FormFields> submitted;

private:
  std::mutex mutex_;
};

class FakeSolver : public ICaptchaSolver {
public:
  std::optional<std::string> Solve(const std::vector<uint8_t>& image) override {
    std::lock_guard<std::mutex> lock(mutex_);
    solved_images.push_back(std::string(image.begin(), image.end()));
    if (!answers.empty()) {
      auto answer = answers.front();
      answers.pop_front();
      return answer;
    }
    return default_answer;
  }

  bool IsAvailable() const override { return available; }

  bool available = true;
  std::deque<std::optional<std::string>> answers;
  std::optional<std::string> default_answer = std::string("abcd");
  std::vector<std::string> solved_images;

private:
  std::mutex mutex_;
};

class FakeMessenger : public IMessenger {
public:
  struct SentImage {
    std::string channel_id;
    std::string caption;
    int64_t message_id = 0;
  };

  void SendText(const std::string& channel_id, const std::string& text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    texts.emplace_back(channel_id, text);
  }

  int64_t SendImage(const std::string& channel_id,
                    const std::vector<uint8_t>& /*image*/,
                    const std::string& caption) override {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t id = deliver_images ? next_message_id++ : 0;
    images.push_back({channel_id, caption, id});
    return id;
  }

  std::vector<InboundMessage> PollUpdates() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InboundMessage> out(inbound.begin(), inbound.end());
    inbound.clear();
    return out;
  }

  std::vector<uint8_t> DownloadDocument(const std::string& file_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents.find(file_id);
    if (it == documents.end()) {
      throw std::runtime_error("unknown file " + file_id);
    }
    return std::vector<uint8_t>(it->second.begin(), it->second.end());
  }

  std::vector<std::string> TextsFor(const std::string& channel_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& entry : texts) {
      if (entry.first == channel_id) {
        out.push_back(entry.second);
      }
    }
    return out;
  }

  std::string LastText() {
    std::lock_guard<std::mutex> lock(mutex_);
    return texts.empty() ? "" : texts.back().second;
  }

  bool deliver_images = true;
  int64_t next_message_id = 500;
  std::vector<std::pair<std::string, std::string>> texts;
  std::vector<SentImage> images;
  std::deque<InboundMessage> inbound;
  std::map<std::string, std::string> documents;

private:
  std::mutex mutex_;
};

inline RegistrantRow MakeRow(int index, const std::string& name,
                             std::optional<std::string> session_name = std::nullopt) {
  RegistrantRow row;
  row.index = index;
  row.full_name = name;
  row.dob_day = "5";
  row.dob_month = "7";
  row.dob_year = "1990";
  row.phone = "0901234567";
  row.email = name + "@example.com";
  row.id_number = "0790" + std::to_string(index);
  row.session_name = std::move(session_name);
  return row;
}

inline InboundMessage MakeText(const std::string& channel_id, const std::string& text,
                               std::optional<int64_t> reply_to = std::nullopt) {
  InboundMessage message;
  message.channel_id = channel_id;
  message.sender_id = "42";
  message.text = text;
  message.reply_to_message_id = reply_to;
  return message;
}

}  // namespace fakes
}  // namespace regbot
