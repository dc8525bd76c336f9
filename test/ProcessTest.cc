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

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include "Mocks.hh"
#include "ProcessBuildSupervisor.hh"
#include "ProcessToolRunner.hh"
#include "relpack/ArtifactProbe.hh"
#include "relpack/Errors.hh"

namespace relpack::test
{
  // =============================================================================
  // ProcessToolRunner
  // =============================================================================

  TEST(ProcessToolRunnerTest, CapturesOutputAndExitCode)
  {
    ProcessToolRunner runner;
    auto result = runner.run(Command{"/bin/sh", {"-c", "echo out; echo err 1>&2; exit 3"}});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().exit_code, 3);
    EXPECT_FALSE(result.value().succeeded());
    EXPECT_NE(result.value().output.find("out"), std::string::npos);
    EXPECT_NE(result.value().output.find("err"), std::string::npos);
  }

  TEST(ProcessToolRunnerTest, AddsEnvironment)
  {
    ProcessToolRunner runner;
    Command command{"sh", {"-c", "echo \"value=$RELPACK_TEST_VALUE\""}};
    command.environment["RELPACK_TEST_VALUE"] = "42";

    auto result = runner.run(command);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().succeeded());
    EXPECT_EQ(result.value().output, "value=42\n");
  }

  TEST(ProcessToolRunnerTest, UnknownProgram)
  {
    ProcessToolRunner runner;
    auto result = runner.run(Command{"relpack-no-such-program", {}});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::ToolLaunchFailed);
  }

  TEST(ProcessToolRunnerTest, FindProgram)
  {
    EXPECT_TRUE(find_program("sh").has_value());
    EXPECT_EQ(find_program("/bin/sh"), std::optional<std::string>("/bin/sh"));
    EXPECT_FALSE(find_program("relpack-no-such-program").has_value());
    EXPECT_FALSE(find_program("").has_value());
  }

  // =============================================================================
  // ProcessBuildSupervisor
  // =============================================================================

  class ProcessBuildSupervisorTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      root_ = std::filesystem::temp_directory_path() / ("relpack-supervisor-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
      std::filesystem::create_directories(root_);
      settings_.working_directory = root_;
      settings_.terminate_grace = std::chrono::seconds(5);
    }

    void TearDown() override
    {
      std::error_code ec;
      std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
    BuilderSettings settings_;
  };

  TEST_F(ProcessBuildSupervisorTest, InjectsCredentialsAndReportsExitCode)
  {
    settings_.command = {"/bin/sh", "-c", "printf '%s' \"$APPLE_TEAM_ID\" > team.txt; exit 3"};
    ProcessBuildSupervisor supervisor(settings_, root_ / "App.app", root_ / "App.dmg");

    auto handle = supervisor.launch(sample_credentials());
    ASSERT_TRUE(handle.has_value());

    auto status = supervisor.join(handle.value());
    EXPECT_EQ(status.exit_code, 3);
    EXPECT_FALSE(status.terminated);
    EXPECT_EQ(handle.value()->lifecycle(), BuildTask::Lifecycle::Completed);
    EXPECT_FALSE(supervisor.is_alive(handle.value()));

    std::ifstream team(root_ / "team.txt");
    std::string value;
    std::getline(team, value);
    EXPECT_EQ(value, "TEAMID1234");
  }

  TEST_F(ProcessBuildSupervisorTest, TerminatesHangingBuild)
  {
    settings_.command = {"/bin/sh", "-c", "sleep 60"};
    ProcessBuildSupervisor supervisor(settings_, root_ / "App.app", root_ / "App.dmg");

    auto handle = supervisor.launch(sample_credentials());
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(supervisor.is_alive(handle.value()));

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(supervisor.terminate(handle.value()).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(30));

    EXPECT_EQ(handle.value()->lifecycle(), BuildTask::Lifecycle::Terminated);
    EXPECT_FALSE(supervisor.is_alive(handle.value()));

    auto status = supervisor.join(handle.value());
    EXPECT_TRUE(status.terminated);

    auto again = supervisor.terminate(handle.value());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), PipelineError::TerminationFailed);
  }

  TEST_F(ProcessBuildSupervisorTest, UnknownBuilder)
  {
    settings_.command = {"relpack-no-such-builder"};
    ProcessBuildSupervisor supervisor(settings_, root_ / "App.app", root_ / "App.dmg");

    auto handle = supervisor.launch(sample_credentials());
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error(), PipelineError::ToolLaunchFailed);
  }

  TEST(BuildTaskTest, RetiresExactlyOnce)
  {
    BuildTask task(1, "App.app", "App.dmg");
    EXPECT_FALSE(task.retired());
    EXPECT_TRUE(task.mark_terminated());
    EXPECT_FALSE(task.mark_completed(0));
    EXPECT_EQ(task.lifecycle(), BuildTask::Lifecycle::Terminated);
    ASSERT_TRUE(task.exit_status().has_value());
    EXPECT_TRUE(task.exit_status()->terminated);
  }

  // =============================================================================
  // FileSystemArtifactProbe
  // =============================================================================

  TEST_F(ProcessBuildSupervisorTest, ProbeRecognizesBundleAndArtifact)
  {
    auto sleeper = std::make_shared<FakeSleeper>();
    auto probe = ArtifactProbe::filesystem(sleeper);
    auto bundle = root_ / "App.app";
    auto artifact = root_ / "App.dmg";

    EXPECT_FALSE(probe->bundle_exists(bundle));
    EXPECT_FALSE(probe->artifact_exists(artifact));
    EXPECT_FALSE(probe->modification_time(artifact).has_value());

    std::filesystem::create_directories(bundle / "Contents");
    EXPECT_FALSE(probe->bundle_exists(bundle));
    {
      std::ofstream plist(bundle / "Contents" / "Info.plist");
      plist << "<plist/>";
    }
    EXPECT_TRUE(probe->bundle_exists(bundle));
    EXPECT_FALSE(probe->artifact_exists(bundle));

    {
      std::ofstream image(artifact);
      image << "image";
    }
    EXPECT_TRUE(probe->artifact_exists(artifact));
    EXPECT_TRUE(probe->modification_time(artifact).has_value());

    // A missing path is not a transient error and is not retried.
    EXPECT_TRUE(sleeper->sleeps().empty());
  }

} // namespace relpack::test
