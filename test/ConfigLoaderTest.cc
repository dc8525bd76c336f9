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

#include "ConfigLoader.hh"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include "relpack/Errors.hh"

namespace relpack::test
{
  class ConfigLoaderTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      loader_ = std::make_unique<ConfigLoader>();
    }

    void TearDown() override
    {
      loader_.reset();
    }

    std::unique_ptr<ConfigLoader> loader_;
  };

  TEST_F(ConfigLoaderTest, EmptyObjectKeepsDefaults)
  {
    auto result = loader_->load_from_json("{}");
    ASSERT_TRUE(result.has_value());

    const auto &config = result.value();
    EXPECT_EQ(config.product.name, "KeliCAD Agent");
    EXPECT_EQ(config.builder.command, (std::vector<std::string>{"npx", "@tauri-apps/cli", "build"}));
    EXPECT_EQ(config.poll.interval, std::chrono::seconds(5));
    EXPECT_EQ(config.poll.deadline, std::chrono::seconds(600));
    EXPECT_EQ(config.poll.heartbeat, std::chrono::seconds(30));
    EXPECT_EQ(config.notarization.staple_attempts, 6);
    EXPECT_EQ(config.notarization.staple_grace, std::chrono::seconds(30));
    EXPECT_EQ(config.notarization.staple_backoff, std::chrono::seconds(10));
    EXPECT_EQ(config.publish_directory, std::filesystem::path("../public/downloads"));
    EXPECT_TRUE(config.reject_stale_artifacts);
  }

  TEST_F(ConfigLoaderTest, DerivedOutputPaths)
  {
    PipelineConfig config;
    EXPECT_EQ(config.bundle_path(), std::filesystem::path("./src-tauri/target/release/bundle/macos/KeliCAD Agent.app"));
    EXPECT_EQ(config.artifact_path(), std::filesystem::path("./src-tauri/target/release/bundle/dmg/KeliCAD Agent_1.0.0_aarch64.dmg"));

    config.builder.artifact_path = "/tmp/custom.dmg";
    EXPECT_EQ(config.artifact_path(), std::filesystem::path("/tmp/custom.dmg"));
  }

  TEST_F(ConfigLoaderTest, ReadsAllSections)
  {
    auto result = loader_->load_from_json(R"({
      "product": { "name": "Demo", "version": "2.1.0", "arch": "x86_64" },
      "builder": {
        "command": ["make", "dist"],
        "working_directory": "/work",
        "output_root": "out",
        "produces_disk_image": false,
        "terminate_grace_seconds": 3,
        "bundle_path": "/work/out/Demo.app"
      },
      "credentials": { "env_file": null, "identity_class": "Apple Distribution" },
      "poll": { "interval_seconds": 2, "deadline_seconds": 60, "heartbeat_seconds": 10 },
      "notarization": {
        "enabled": false,
        "acceptance_marker": "Approved",
        "staple_grace_seconds": 1,
        "staple_attempts": 2,
        "staple_backoff_seconds": 4
      },
      "publish": { "directory": "/srv/downloads" },
      "validation": { "reject_stale_artifacts": false },
      "tools": { "xcrun": "/usr/bin/xcrun", "spctl": "/usr/sbin/spctl" }
    })");
    ASSERT_TRUE(result.has_value());

    const auto &config = result.value();
    EXPECT_EQ(config.product.name, "Demo");
    EXPECT_EQ(config.builder.command, (std::vector<std::string>{"make", "dist"}));
    EXPECT_FALSE(config.builder.produces_disk_image);
    EXPECT_EQ(config.builder.terminate_grace, std::chrono::seconds(3));
    EXPECT_EQ(config.bundle_path(), std::filesystem::path("/work/out/Demo.app"));
    EXPECT_EQ(config.artifact_path(), std::filesystem::path("/work/out/dmg/Demo_2.1.0_x86_64.dmg"));
    EXPECT_FALSE(config.credentials.env_file.has_value());
    EXPECT_EQ(config.credentials.identity_class, "Apple Distribution");
    EXPECT_EQ(config.poll.interval, std::chrono::seconds(2));
    EXPECT_EQ(config.poll.deadline, std::chrono::seconds(60));
    EXPECT_FALSE(config.notarization.enabled);
    EXPECT_EQ(config.notarization.acceptance_marker, "Approved");
    EXPECT_EQ(config.notarization.staple_attempts, 2);
    EXPECT_EQ(config.publish_directory, std::filesystem::path("/srv/downloads"));
    EXPECT_FALSE(config.reject_stale_artifacts);
    EXPECT_EQ(config.tools.xcrun, "/usr/bin/xcrun");
    EXPECT_EQ(config.tools.codesign, "codesign");
  }

  TEST_F(ConfigLoaderTest, InvalidJson)
  {
    auto result = loader_->load_from_json("{ not json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::InvalidConfiguration);
  }

  TEST_F(ConfigLoaderTest, RootNotObject)
  {
    auto result = loader_->load_from_json("[]");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::InvalidConfiguration);
  }

  TEST_F(ConfigLoaderTest, RejectsInvalidValues)
  {
    const char *documents[] = {
      R"({"product": "Demo"})",
      R"({"product": {"name": 42}})",
      R"({"product": {"name": ""}})",
      R"({"builder": {"command": []}})",
      R"({"builder": {"command": "npx build"}})",
      R"({"builder": {"command": ["npx", 1]}})",
      R"({"builder": {"produces_disk_image": "yes"}})",
      R"({"poll": {"interval_seconds": 0}})",
      R"({"poll": {"deadline_seconds": -5}})",
      R"({"poll": {"interval_seconds": 30, "deadline_seconds": 10}})",
      R"({"notarization": {"staple_attempts": 0}})",
      R"({"notarization": {"acceptance_marker": ""}})",
      R"({"credentials": {"env_file": 3}})",
      R"({"publish": {"directory": ""}})",
    };

    for (const auto *document: documents)
      {
        auto result = loader_->load_from_json(document);
        ASSERT_FALSE(result.has_value()) << document;
        EXPECT_EQ(result.error(), PipelineError::InvalidConfiguration) << document;
      }
  }

  TEST_F(ConfigLoaderTest, EmptyEnvFileDisablesIt)
  {
    auto result = loader_->load_from_json(R"({"credentials": {"env_file": ""}})");
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.value().credentials.env_file.has_value());
  }

  TEST_F(ConfigLoaderTest, LoadFromFile)
  {
    auto path = std::filesystem::temp_directory_path() / "relpack-config-test.json";
    {
      std::ofstream file(path);
      file << R"({"publish": {"directory": "/srv/releases"}})";
    }

    auto result = loader_->load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().publish_directory, std::filesystem::path("/srv/releases"));
  }

  TEST_F(ConfigLoaderTest, LoadFromMissingFile)
  {
    auto result = loader_->load_from_file("/nonexistent/relpack.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::InvalidConfiguration);
  }

} // namespace relpack::test
