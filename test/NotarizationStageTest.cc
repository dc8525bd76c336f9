// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "relpack/Notarization.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "Mocks.hh"
#include "Policy.hh"
#include "relpack/Errors.hh"

namespace relpack::test
{
  using ::testing::_;
  using ::testing::InSequence;
  using ::testing::NiceMock;
  using ::testing::Return;

  class NotarizationStageTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      oracle_ = std::make_shared<NiceMock<MockVerificationOracle>>();
      notary_ = std::make_shared<NiceMock<MockNotaryClient>>();
      stapler_ = std::make_shared<NiceMock<MockStapler>>();
      sleeper_ = std::make_shared<FakeSleeper>();

      ON_CALL(*oracle_, accepts(_)).WillByDefault(Return(false));
      ON_CALL(*notary_, submit(_, _))
        .WillByDefault(Return(outcome::std_result<NotarizationReceipt>(NotarizationReceipt{"2efe2717-52ef-43a5-96dc-0797e4ca1041", "Accepted", true})));
      ON_CALL(*stapler_, staple(_)).WillByDefault(Return(ok()));
    }

    NotarizationStage make_stage()
    {
      return NotarizationStage(settings_, oracle_, notary_, stapler_, sleeper_);
    }

    NotarizationSettings settings_;
    std::shared_ptr<NiceMock<MockVerificationOracle>> oracle_;
    std::shared_ptr<NiceMock<MockNotaryClient>> notary_;
    std::shared_ptr<NiceMock<MockStapler>> stapler_;
    std::shared_ptr<FakeSleeper> sleeper_;
    const std::filesystem::path artifact_{"out/dmg/App.dmg"};
  };

  TEST_F(NotarizationStageTest, AlreadyNotarizedSkipsSubmission)
  {
    ON_CALL(*oracle_, accepts(_)).WillByDefault(Return(true));
    EXPECT_CALL(*notary_, submit(_, _)).Times(0);
    EXPECT_CALL(*stapler_, staple(_)).Times(0);

    auto stage = make_stage();
    auto result = stage.run(artifact_, sample_credentials());

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().already_notarized);
    EXPECT_FALSE(result.value().submitted);
  }

  TEST_F(NotarizationStageTest, SubmitsAndStaples)
  {
    EXPECT_CALL(*notary_, submit(artifact_, _)).Times(1);
    EXPECT_CALL(*stapler_, staple(artifact_)).Times(1);

    auto stage = make_stage();
    auto result = stage.run(artifact_, sample_credentials());

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().submitted);
    EXPECT_TRUE(result.value().stapled);
    EXPECT_EQ(result.value().staple_attempts, 1);
    EXPECT_EQ(result.value().submission_id, "2efe2717-52ef-43a5-96dc-0797e4ca1041");
    EXPECT_TRUE(result.value().warnings.empty());

    // Grace period before the first attempt.
    ASSERT_EQ(sleeper_->sleeps().size(), 1U);
    EXPECT_EQ(sleeper_->sleeps()[0], std::chrono::seconds(30));
  }

  TEST_F(NotarizationStageTest, RejectionIsFatalAndNotStapled)
  {
    EXPECT_CALL(*notary_, submit(_, _))
      .Times(1)
      .WillOnce(Return(outcome::std_result<NotarizationReceipt>(PipelineError::NotarizationRejected)));
    EXPECT_CALL(*stapler_, staple(_)).Times(0);

    auto stage = make_stage();
    auto result = stage.run(artifact_, sample_credentials());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::NotarizationRejected);
    EXPECT_EQ(severity_of(result.error()), Severity::Fatal);
  }

  TEST_F(NotarizationStageTest, StapleRetriedUntilSuccess)
  {
    {
      InSequence sequence;
      EXPECT_CALL(*stapler_, staple(_)).WillOnce(Return(fail(PipelineError::StapleExhausted)));
      EXPECT_CALL(*stapler_, staple(_)).WillOnce(Return(fail(PipelineError::StapleExhausted)));
      EXPECT_CALL(*stapler_, staple(_)).WillOnce(Return(ok()));
    }

    auto stage = make_stage();
    auto result = stage.run(artifact_, sample_credentials());

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().stapled);
    EXPECT_EQ(result.value().staple_attempts, 3);
    EXPECT_EQ(sleeper_->now(), std::chrono::seconds(30 + 2 * 10));
  }

  TEST_F(NotarizationStageTest, ExhaustedStapleIsAWarning)
  {
    EXPECT_CALL(*stapler_, staple(_)).Times(6).WillRepeatedly(Return(fail(PipelineError::StapleExhausted)));

    auto stage = make_stage();
    auto result = stage.run(artifact_, sample_credentials());

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.value().stapled);
    EXPECT_EQ(result.value().staple_attempts, 6);
    ASSERT_EQ(result.value().warnings.size(), 1U);
    EXPECT_EQ(result.value().warnings[0], PipelineError::StapleExhausted);

    // Grace period, then a backoff between consecutive attempts.
    EXPECT_EQ(sleeper_->sleeps().size(), 6U);
    EXPECT_EQ(sleeper_->now(), std::chrono::seconds(30 + 5 * 10));
  }

  // =============================================================================
  // Notary client
  // =============================================================================

  TEST(NotaryVerdictTest, ParsesJsonOutput)
  {
    auto receipt = parse_notary_verdict(R"({"id":"abc-123","status":"Accepted","message":"Processing complete"})", "Accepted");
    EXPECT_TRUE(receipt.accepted);
    EXPECT_EQ(receipt.submission_id, "abc-123");
    EXPECT_EQ(receipt.status, "Accepted");
  }

  TEST(NotaryVerdictTest, JsonInvalidVerdict)
  {
    auto receipt = parse_notary_verdict("Conducting pre-submission checks...\n"
                                        R"({"id":"abc-123","status":"Invalid","message":"Processing complete"})",
                                        "Accepted");
    EXPECT_FALSE(receipt.accepted);
    EXPECT_EQ(receipt.status, "Invalid");
  }

  TEST(NotaryVerdictTest, ScansTextOutput)
  {
    auto receipt = parse_notary_verdict("Processing complete\n"
                                        "  id: abc-123\n"
                                        "  status: Accepted\n",
                                        "Accepted");
    EXPECT_TRUE(receipt.accepted);
    EXPECT_EQ(receipt.submission_id, "abc-123");
    EXPECT_EQ(receipt.status, "Accepted");
  }

  TEST(NotaryVerdictTest, TextStatusLineDecides)
  {
    auto receipt = parse_notary_verdict("Accepted submission for processing\n"
                                        "  id: abc-123\n"
                                        "  status: Invalid\n",
                                        "Accepted");
    EXPECT_FALSE(receipt.accepted);
    EXPECT_EQ(receipt.status, "Invalid");
  }

  TEST(NotaryVerdictTest, TextMarkerWithoutStatusLine)
  {
    auto receipt = parse_notary_verdict("Processing complete. Accepted\n", "Accepted");
    EXPECT_TRUE(receipt.accepted);
    EXPECT_EQ(receipt.status, "Accepted");
  }

  TEST(NotaryVerdictTest, TextWithoutMarker)
  {
    auto receipt = parse_notary_verdict("  id: abc-123\n  status: In Progress\n", "Accepted");
    EXPECT_FALSE(receipt.accepted);
  }

  TEST(NotaryClientTest, NonZeroExitIsRejected)
  {
    auto runner = std::make_shared<MockToolRunner>();
    EXPECT_CALL(*runner, run(_)).WillOnce(Return(outcome::std_result<CommandOutput>(CommandOutput{1, R"({"status":"Accepted"})"})));

    auto notary = NotaryClient::notarytool(runner, "xcrun", "Accepted");
    auto result = notary->submit("App.dmg", sample_credentials());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::NotarizationRejected);
  }

  TEST(NotaryClientTest, PassesCredentialsAndRedactsThem)
  {
    auto runner = std::make_shared<MockToolRunner>();
    EXPECT_CALL(*runner, run(_)).WillOnce([](const Command &command) -> outcome::std_result<CommandOutput> {
      EXPECT_EQ(command.program, "xcrun");
      EXPECT_EQ(command.arguments,
                (std::vector<std::string>{"notarytool",
                                          "submit",
                                          "App.dmg",
                                          "--apple-id",
                                          "dev@example.com",
                                          "--password",
                                          "abcd-efgh-ijkl-mnop",
                                          "--team-id",
                                          "TEAMID1234",
                                          "--wait",
                                          "--output-format",
                                          "json"}));
      auto description = command.describe();
      EXPECT_EQ(description.find("abcd-efgh-ijkl-mnop"), std::string::npos);
      EXPECT_EQ(description.find("dev@example.com"), std::string::npos);
      return CommandOutput{0, R"({"id":"abc-123","status":"Accepted"})"};
    });

    auto notary = NotaryClient::notarytool(runner, "xcrun", "Accepted");
    auto result = notary->submit("App.dmg", sample_credentials());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().submission_id, "abc-123");
  }

  TEST(StaplerTest, NonZeroExitFails)
  {
    auto runner = std::make_shared<MockToolRunner>();
    EXPECT_CALL(*runner, run(_)).WillOnce([](const Command &command) -> outcome::std_result<CommandOutput> {
      EXPECT_EQ(command.arguments, (std::vector<std::string>{"stapler", "staple", "App.dmg"}));
      return CommandOutput{65, "CloudKit query failed"};
    });

    auto stapler = Stapler::xcrun(runner, "xcrun");
    EXPECT_FALSE(stapler->staple("App.dmg").has_value());
  }

} // namespace relpack::test
