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

#include <vector>
#include <spdlog/common.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "relpack/Errors.hh"

namespace relpack
{
  std::shared_ptr<spdlog::logger> Logging::create(std::string domain)
  {
    auto logger = spdlog::get(domain);
    if (!logger)
      {
        auto default_logger = spdlog::default_logger();
        logger = std::make_shared<spdlog::logger>(domain, default_logger->sinks().begin(), default_logger->sinks().end());
        logger->set_level(default_logger->level());
        logger->flush_on(spdlog::level::err);
        spdlog::register_logger(logger);
      }
    return logger;
  }

  outcome::std_result<void> Logging::setup(spdlog::level::level_enum level, const std::optional<std::filesystem::path> &log_file)
  {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (log_file)
      {
        try
          {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
          }
        catch (const spdlog::spdlog_ex &e)
          {
            spdlog::error("Cannot open log file {}: {}", log_file->string(), e.what());
            return PipelineError::SystemError;
          }
      }

    spdlog::drop_all();

    auto logger = std::make_shared<spdlog::logger>("relpack", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%-5l%$] %v");

    spdlog::cfg::load_env_levels();
    return outcome::success();
  }

} // namespace relpack
