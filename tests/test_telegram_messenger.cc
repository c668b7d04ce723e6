#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "regbot_telegram_messenger.h"

using namespace regbot;

TEST(TelegramMessengerTest, ParsesTextRepliesAndDocuments) {
  const char* body = R"({"ok":true,"result":[
    {"update_id":10,"message":{"message_id":5,"chat":{"id":-100123},"from":{"id":42},
      "text":"x7k2","reply_to_message":{"message_id":4}}},
    {"update_id":11,"message":{"message_id":6,"chat":{"id":-100123},"from":{"id":42},
      "document":{"file_id":"F1","file_name":"rows.csv"}}},
    {"update_id":12,"edited_message":{"message_id":6}}
  ]})";

  auto messages = TelegramMessenger::ParseUpdates(body);
  ASSERT_EQ(messages.size(), 3u);

  EXPECT_EQ(messages[0].update_id, 10);
  EXPECT_EQ(messages[0].channel_id, "-100123");
  EXPECT_EQ(messages[0].sender_id, "42");
  EXPECT_EQ(messages[0].text, "x7k2");
  EXPECT_EQ(messages[0].reply_to_message_id, std::optional<int64_t>(4));
  EXPECT_FALSE(messages[0].document_file_id.has_value());

  EXPECT_EQ(messages[1].document_file_id, std::optional<std::string>("F1"));
  EXPECT_EQ(messages[1].document_name, "rows.csv");
  EXPECT_FALSE(messages[1].reply_to_message_id.has_value());

  // Kept only so the poll offset moves past it
  EXPECT_EQ(messages[2].update_id, 12);
  EXPECT_TRUE(messages[2].channel_id.empty());
}

TEST(TelegramMessengerTest, MalformedUpdateDoesNotDropTheBatch) {
  const char* body = R"({"ok":true,"result":[
    {"update_id":20,"message":{"message_id":7,"chat":{"id":1},"from":{"id":42},
      "text":"abcd","reply_to_message":{"message_id":"not-a-number"}}},
    {"update_id":21,"message":{"message_id":8,"chat":{"id":1},"from":{"id":42},"text":5}},
    {"update_id":22,"message":{"message_id":9,"chat":{"id":1},"from":{"id":42},"text":"/status"}}
  ]})";

  std::vector<InboundMessage> messages;
  ASSERT_NO_THROW(messages = TelegramMessenger::ParseUpdates(body));
  ASSERT_EQ(messages.size(), 3u);

  EXPECT_EQ(messages[0].update_id, 20);
  EXPECT_TRUE(messages[0].channel_id.empty());
  EXPECT_EQ(messages[1].update_id, 21);
  EXPECT_TRUE(messages[1].channel_id.empty());

  EXPECT_EQ(messages[2].update_id, 22);
  EXPECT_EQ(messages[2].channel_id, "1");
  EXPECT_EQ(messages[2].text, "/status");
}

TEST(TelegramMessengerTest, FailedUpdateReplyThrows) {
  EXPECT_THROW(TelegramMessenger::ParseUpdates(R"({"ok":false,"description":"Unauthorized"})"),
               std::runtime_error);
  EXPECT_THROW(TelegramMessenger::ParseUpdates("<html>502</html>"), std::runtime_error);
}

TEST(TelegramMessengerTest, MessageIdOfASendReply) {
  EXPECT_EQ(TelegramMessenger::ParseMessageId(R"({"ok":true,"result":{"message_id":812}})"), 812);
  EXPECT_EQ(TelegramMessenger::ParseMessageId(R"({"ok":false,"description":"Bad Request"})"), 0);
  EXPECT_EQ(TelegramMessenger::ParseMessageId("not json"), 0);
}
