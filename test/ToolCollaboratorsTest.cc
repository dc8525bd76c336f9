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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "Mocks.hh"
#include "relpack/DiskImage.hh"
#include "relpack/Errors.hh"
#include "relpack/Verification.hh"

namespace relpack::test
{
  using ::testing::_;
  using ::testing::InSequence;
  using ::testing::Return;

  namespace
  {
    outcome::std_result<CommandOutput> exited(int exit_code, std::string output = {})
    {
      return CommandOutput{exit_code, std::move(output)};
    }
  } // namespace

  class ToolCollaboratorsTest : public ::testing::Test
  {
  protected:
    std::shared_ptr<MockToolRunner> runner_{std::make_shared<MockToolRunner>()};
  };

  TEST_F(ToolCollaboratorsTest, OracleAcceptsOnZeroExit)
  {
    EXPECT_CALL(*runner_, run(_)).WillOnce([](const Command &command) {
      EXPECT_EQ(command.program, "spctl");
      EXPECT_EQ(command.arguments, (std::vector<std::string>{"-a", "-t", "open", "--context", "context:primary-signature", "App.dmg"}));
      return exited(0, "App.dmg: accepted\nsource=Notarized Developer ID\n");
    });

    auto oracle = VerificationOracle::spctl(runner_, "spctl");
    EXPECT_TRUE(oracle->accepts("App.dmg"));
  }

  TEST_F(ToolCollaboratorsTest, OracleTreatsFailuresAsNotAccepted)
  {
    EXPECT_CALL(*runner_, run(_))
      .WillOnce(Return(exited(3, "App.dmg: rejected\n")))
      .WillOnce(Return(outcome::std_result<CommandOutput>(PipelineError::ToolLaunchFailed)));

    auto oracle = VerificationOracle::spctl(runner_, "spctl");
    EXPECT_FALSE(oracle->accepts("App.dmg"));
    EXPECT_FALSE(oracle->accepts("App.dmg"));
  }

  TEST_F(ToolCollaboratorsTest, SignatureVerifier)
  {
    EXPECT_CALL(*runner_, run(_))
      .WillOnce([](const Command &command) {
        EXPECT_EQ(command.program, "codesign");
        EXPECT_EQ(command.arguments, (std::vector<std::string>{"-v", "App.dmg"}));
        return exited(0);
      })
      .WillOnce(Return(exited(1, "App.dmg: invalid signature (code or signature have been modified)\n")));

    auto verifier = SignatureVerifier::codesign(runner_, "codesign");
    EXPECT_TRUE(verifier->verify("App.dmg"));
    EXPECT_FALSE(verifier->verify("App.dmg"));
  }

  TEST_F(ToolCollaboratorsTest, DiskImageCreatedThenSigned)
  {
    auto dir = std::filesystem::temp_directory_path() / "relpack-disk-image-test";
    auto disk_image = dir / "App_1.0.0_aarch64.dmg";

    {
      InSequence sequence;
      EXPECT_CALL(*runner_, run(_)).WillOnce([disk_image](const Command &command) {
        EXPECT_EQ(command.program, "hdiutil");
        EXPECT_EQ(command.arguments,
                  (std::vector<std::string>{"create", "-volname", "App", "-srcfolder", "App.app", "-ov", "-format", "UDZO", disk_image.string()}));
        return exited(0);
      });
      EXPECT_CALL(*runner_, run(_)).WillOnce([disk_image](const Command &command) {
        EXPECT_EQ(command.program, "codesign");
        EXPECT_EQ(command.arguments, (std::vector<std::string>{"--force", "--timestamp", "--sign", "Developer ID Application: Example", disk_image.string()}));
        return exited(0);
      });
    }

    auto creator = DiskImageCreator::hdiutil(runner_, "hdiutil", "codesign");
    auto result = creator->create("App.app", disk_image, "App", "Developer ID Application: Example");
    EXPECT_TRUE(result.has_value());

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  TEST_F(ToolCollaboratorsTest, DiskImageFailureStopsBeforeSigning)
  {
    EXPECT_CALL(*runner_, run(_)).Times(1).WillOnce(Return(exited(1, "hdiutil: create failed - Resource busy\n")));

    auto creator = DiskImageCreator::hdiutil(runner_, "hdiutil", "codesign");
    auto result = creator->create("App.app", std::filesystem::temp_directory_path() / "App.dmg", "App", "identity");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::DiskImageFailed);
  }

} // namespace relpack::test
