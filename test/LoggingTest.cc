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

#include "Logging.hh"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "relpack/Errors.hh"

namespace relpack::test
{
  class LoggingTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      root_ = std::filesystem::temp_directory_path() / ("relpack-logging-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
      std::filesystem::create_directories(root_);
    }

    void TearDown() override
    {
      std::error_code ec;
      std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
  };

  TEST_F(LoggingTest, UnwritableLogFileIsReported)
  {
    // A regular file where the log directory should be.
    {
      std::ofstream blocker(root_ / "logs");
      blocker << "not a directory";
    }
    auto before = spdlog::default_logger();

    auto result = Logging::setup(spdlog::level::debug, root_ / "logs" / "relpack.log");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PipelineError::SystemError);
    EXPECT_EQ(spdlog::default_logger(), before);
  }

  TEST_F(LoggingTest, DomainLoggersShareDefaultSinks)
  {
    auto logger = Logging::create("relpack:logging_test");

    EXPECT_EQ(logger->name(), "relpack:logging_test");
    EXPECT_EQ(logger->sinks().size(), spdlog::default_logger()->sinks().size());
    EXPECT_EQ(Logging::create("relpack:logging_test"), logger);
  }

} // namespace relpack::test
