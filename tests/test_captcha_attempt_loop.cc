#include <gtest/gtest.h>
#include <memory>
#include <vector>
#include "regbot_captcha_attempt_loop.h"
#include "regbot_registration_payload.h"
#include "regbot_test_fakes.h"

using namespace regbot;
using regbot::fakes::FakeMessenger;
using regbot::fakes::FakeSiteGateway;
using regbot::fakes::FakeSolver;

namespace {

class CaptchaAttemptLoopTest : public ::testing::Test {
protected:
  RowContext Context(int row_index = 0) {
    return {"chat-1", "24/12/2024", "77", {"101", "Session 1"},
            fakes::MakeRow(row_index, "Row" + std::to_string(row_index))};
  }

  AttemptLoopConfig AutoConfig(int max_attempts = 4) {
    AttemptLoopConfig config;
    config.max_attempts = max_attempts;
    config.auto_solve = true;
    return config;
  }

  std::shared_ptr<FakeSiteGateway> site_ = std::make_shared<FakeSiteGateway>();
  FakeSiteGateway& gateway_ = *site_;
  FakeSolver solver_;
  FakeMessenger messenger_;
  PendingCaptchaStore pending_;
};

}  // namespace

TEST_F(CaptchaAttemptLoopTest, FirstAnswerAccepted) {
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig());

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::SUCCESS);
  EXPECT_EQ(result.attempts, 1);
  EXPECT_EQ(result.day_label, "24/12/2024");
  ASSERT_EQ(gateway_.submitted.size(), 1u);
  EXPECT_EQ(gateway_.submitted[0].at("Captcha"), "abcd");
  EXPECT_EQ(gateway_.submitted[0].at("idPhien"), "101");
}

TEST_F(CaptchaAttemptLoopTest, SolverSilenceExhaustsEveryAttemptWithFreshChallenges) {
  solver_.default_answer = std::nullopt;
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig(4));

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::FAILED);
  EXPECT_EQ(result.attempts, 4);
  EXPECT_EQ(gateway_.captcha_requests, 4);
  ASSERT_EQ(solver_.solved_images.size(), 4u);
  for (size_t i = 1; i < solver_.solved_images.size(); ++i) {
    EXPECT_NE(solver_.solved_images[i], solver_.solved_images[i - 1]);
  }
  EXPECT_TRUE(gateway_.submitted.empty());
  EXPECT_EQ(pending_.Size(), 0u);
}

TEST_F(CaptchaAttemptLoopTest, RejectedCaptchasRetryUpToTheBudget) {
  gateway_.default_response = "Sai captcha";
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig(3));

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::FAILED);
  EXPECT_EQ(result.attempts, 3);
  EXPECT_EQ(gateway_.submitted.size(), 3u);
  EXPECT_NE(result.detail.find("3/3"), std::string::npos);
}

TEST_F(CaptchaAttemptLoopTest, RejectedThenAccepted) {
  gateway_.responses = {"Captcha khong dung", "!!!True|~~|"};
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig());

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::SUCCESS);
  EXPECT_EQ(result.attempts, 2);
}

TEST_F(CaptchaAttemptLoopTest, UnknownFailureStopsWithoutResubmitting) {
  gateway_.default_response = "CCCD already registered";
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig());

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::OTHER_FAILURE);
  EXPECT_EQ(gateway_.submitted.size(), 1u);
  EXPECT_NE(result.detail.find("CCCD already registered"), std::string::npos);
}

TEST_F(CaptchaAttemptLoopTest, SessionFullEndsTheRow) {
  gateway_.default_response = "Phiên đã hết chỗ";
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig());

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::SESSION_FULL);
  EXPECT_EQ(gateway_.submitted.size(), 1u);
}

TEST_F(CaptchaAttemptLoopTest, MissingChallengeEndsWithoutRetry) {
  gateway_.captcha_available = false;
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig());

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::OTHER_FAILURE);
  EXPECT_EQ(gateway_.captcha_requests, 1);
}

TEST_F(CaptchaAttemptLoopTest, NetworkErrorConsumesAnAttempt) {
  gateway_.captcha_network_errors = 2;
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig(4));

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::SUCCESS);
  EXPECT_EQ(result.attempts, 3);
}

TEST_F(CaptchaAttemptLoopTest, InvalidRowFailsBeforeAnyNetworkCall) {
  RowContext ctx = Context();
  ctx.row.dob_year = "nineteen ninety";
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig());

  EXPECT_THROW(loop.Run(ctx), InvalidRowError);
  EXPECT_EQ(gateway_.captcha_requests, 0);
}

TEST_F(CaptchaAttemptLoopTest, ManualModeHandsTheRowToTheOperator) {
  AttemptLoopConfig config;  // no auto solve
  CaptchaAttemptLoop loop(site_, nullptr, messenger_, pending_, config);

  RowResult result = loop.Run(Context(2));

  EXPECT_EQ(result.status, RowStatus::AWAIT_MANUAL);
  EXPECT_EQ(result.attempts, 0);
  EXPECT_TRUE(gateway_.submitted.empty());
  ASSERT_EQ(messenger_.images.size(), 1u);
  EXPECT_EQ(messenger_.images[0].channel_id, "chat-1");
  EXPECT_NE(messenger_.images[0].caption.find("24/12/2024"), std::string::npos);
  EXPECT_NE(messenger_.images[0].caption.find("Row 3"), std::string::npos);

  auto keys = pending_.PendingFor("chat-1");
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys[0], (PendingCaptchaKey{"chat-1", "24/12/2024", 2}));

  auto task = pending_.PopByPrompt("chat-1", messenger_.images[0].message_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->day_id, "77");
  EXPECT_EQ(task->session_id, "101");
}

TEST_F(CaptchaAttemptLoopTest, UnavailableSolverFallsBackToManual) {
  solver_.available = false;
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig());

  EXPECT_FALSE(loop.AutoSolveActive());
  EXPECT_EQ(loop.Run(Context()).status, RowStatus::AWAIT_MANUAL);
  EXPECT_TRUE(solver_.solved_images.empty());
}

TEST_F(CaptchaAttemptLoopTest, ExhaustedAutoAttemptsCanAskTheOperator) {
  solver_.default_answer = std::nullopt;
  AttemptLoopConfig config = AutoConfig(2);
  config.manual_fallback_on_exhaustion = true;
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, config);

  RowResult result = loop.Run(Context());

  EXPECT_EQ(result.status, RowStatus::AWAIT_MANUAL);
  EXPECT_EQ(result.attempts, 2);
  EXPECT_EQ(gateway_.captcha_requests, 3);
  EXPECT_EQ(pending_.Size(), 1u);
}

TEST_F(CaptchaAttemptLoopTest, ResumeManualSubmitsOnce) {
  gateway_.default_response = "Sai captcha";
  CaptchaAttemptLoop loop(site_, nullptr, messenger_, pending_, AttemptLoopConfig());
  loop.Run(Context());
  auto task = pending_.PopByChannel("chat-1");
  ASSERT_TRUE(task.has_value());

  ManualResumeResult result = loop.ResumeManual(*task, " q9w8 ");

  EXPECT_EQ(result.outcome, SubmissionOutcome::CAPTCHA_REJECTED);
  ASSERT_EQ(gateway_.submitted.size(), 1u);
  EXPECT_EQ(gateway_.submitted[0].at("Captcha"), "q9w8");
  EXPECT_EQ(pending_.Size(), 0u);
  EXPECT_EQ(messenger_.images.size(), 1u);
}

TEST_F(CaptchaAttemptLoopTest, EachOperatorPromptGetsItsOwnSiteSession) {
  std::vector<std::shared_ptr<FakeSiteGateway>> opened;
  SiteSessionFactory open_session = [&opened]() {
    opened.push_back(std::make_shared<FakeSiteGateway>());
    return opened.back();
  };
  CaptchaAttemptLoop loop(site_, nullptr, messenger_, pending_, AttemptLoopConfig(),
                          open_session);

  EXPECT_EQ(loop.Run(Context(0)).status, RowStatus::AWAIT_MANUAL);
  EXPECT_EQ(loop.Run(Context(1)).status, RowStatus::AWAIT_MANUAL);

  ASSERT_EQ(opened.size(), 2u);
  EXPECT_EQ(gateway_.captcha_requests, 0);
  EXPECT_EQ(opened[0]->captcha_requests, 1);
  EXPECT_EQ(opened[1]->captcha_requests, 1);

  // Answers go back through the session that issued each captcha, even from
  // a loop bound to another gateway
  auto other_site = std::make_shared<FakeSiteGateway>();
  CaptchaAttemptLoop resume_loop(other_site, nullptr, messenger_, pending_, AttemptLoopConfig());
  auto first = pending_.PopByPrompt("chat-1", messenger_.images[0].message_id);
  auto second = pending_.PopByPrompt("chat-1", messenger_.images[1].message_id);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  EXPECT_EQ(resume_loop.ResumeManual(*second, "bbbb").outcome, SubmissionOutcome::SUCCESS);
  EXPECT_EQ(resume_loop.ResumeManual(*first, "aaaa").outcome, SubmissionOutcome::SUCCESS);

  EXPECT_TRUE(other_site->Submitted().empty());
  EXPECT_TRUE(gateway_.Submitted().empty());
  EXPECT_EQ(opened[0]->SubmittedNames(), std::vector<std::string>({"Row0"}));
  EXPECT_EQ(opened[1]->SubmittedNames(), std::vector<std::string>({"Row1"}));
  EXPECT_EQ(opened[0]->Submitted()[0].at("Captcha"), "aaaa");
}

TEST_F(CaptchaAttemptLoopTest, AutomaticAttemptsStayOnTheDaySession) {
  int opened = 0;
  SiteSessionFactory open_session = [&opened]() {
    ++opened;
    return std::make_shared<FakeSiteGateway>();
  };
  CaptchaAttemptLoop loop(site_, &solver_, messenger_, pending_, AutoConfig(), open_session);

  EXPECT_EQ(loop.Run(Context()).status, RowStatus::SUCCESS);
  EXPECT_EQ(opened, 0);
  EXPECT_EQ(gateway_.captcha_requests, 1);
  EXPECT_EQ(gateway_.Submitted().size(), 1u);
}
