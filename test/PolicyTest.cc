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

#include "Policy.hh"

#include <gtest/gtest.h>

#include "Logging.hh"
#include "relpack/Errors.hh"
#include "relpack/ToolRunner.hh"

namespace relpack::test
{
  class PolicyTest : public ::testing::Test
  {
  protected:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:policy_test")};
    std::vector<std::error_code> warnings_;
  };

  TEST_F(PolicyTest, Severities)
  {
    EXPECT_EQ(severity_of(PipelineError::StapleExhausted), Severity::Warning);
    EXPECT_EQ(severity_of(PipelineError::NotarizationUnverified), Severity::Warning);
    EXPECT_EQ(severity_of(PipelineError::TerminationFailed), Severity::Expected);
    EXPECT_EQ(severity_of(PipelineError::MissingCredential), Severity::Fatal);
    EXPECT_EQ(severity_of(PipelineError::BuildArtifactMissing), Severity::Fatal);
    EXPECT_EQ(severity_of(PipelineError::NotarizationRejected), Severity::Fatal);
    EXPECT_EQ(severity_of(PipelineError::SignatureInvalid), Severity::Fatal);
    EXPECT_EQ(severity_of(std::make_error_code(std::errc::io_error)), Severity::Fatal);
  }

  TEST_F(PolicyTest, SuccessPassesThrough)
  {
    EXPECT_TRUE(degrade(outcome::success(), warnings_, *logger_, "step").has_value());
    EXPECT_TRUE(warnings_.empty());
  }

  TEST_F(PolicyTest, WarningIsRecorded)
  {
    auto result = degrade(PipelineError::StapleExhausted, warnings_, *logger_, "staple");
    EXPECT_TRUE(result.has_value());
    ASSERT_EQ(warnings_.size(), 1U);
    EXPECT_EQ(warnings_[0], PipelineError::StapleExhausted);
  }

  TEST_F(PolicyTest, ExpectedFailureIsDropped)
  {
    auto result = degrade(PipelineError::TerminationFailed, warnings_, *logger_, "terminate");
    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(warnings_.empty());
  }

  TEST_F(PolicyTest, FatalErrorPropagates)
  {
    auto result = degrade(PipelineError::SignatureInvalid, warnings_, *logger_, "verify");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::SignatureInvalid);
    EXPECT_TRUE(warnings_.empty());
  }

  TEST(ErrorsTest, CategoryAndMessages)
  {
    std::error_code ec = PipelineError::NotarizationRejected;
    EXPECT_STREQ(ec.category().name(), "relpack");
    EXPECT_FALSE(ec.message().empty());
    EXPECT_NE(make_error_code(PipelineError::MissingCredential).message(), make_error_code(PipelineError::BuildArtifactMissing).message());
  }

  TEST(CommandTest, DescribeQuotesAndRedacts)
  {
    Command command{"codesign", {"--sign", "Developer ID Application: Example", "--password", "hunter2", "App.dmg"}};
    command.sensitive_values = {"hunter2"};

    EXPECT_EQ(command.describe(), "codesign --sign \"Developer ID Application: Example\" --password **** App.dmg");
  }

} // namespace relpack::test
