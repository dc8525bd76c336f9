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

#ifndef RELPACK_LOGGING_HH
#define RELPACK_LOGGING_HH

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

namespace outcome = boost::outcome_v2;

namespace relpack
{
  class Logging
  {
  public:
    /**
     * @brief Returns the logger for a domain, sharing the sinks of the default logger
     */
    static std::shared_ptr<spdlog::logger> create(std::string domain);

    /**
     * @brief Installs a colored console sink and an optional log file
     *
     * SPDLOG_LEVEL in the environment overrides the level per logger.
     *
     * @return PipelineError::SystemError if the log file cannot be opened;
     *         the current loggers are then left untouched
     */
    static outcome::std_result<void> setup(spdlog::level::level_enum level, const std::optional<std::filesystem::path> &log_file = std::nullopt);
  };
} // namespace relpack

#endif // RELPACK_LOGGING_HH
