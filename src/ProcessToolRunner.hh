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

#ifndef RELPACK_PROCESS_TOOL_RUNNER_HH
#define RELPACK_PROCESS_TOOL_RUNNER_HH

#include <memory>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/ToolRunner.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  /**
   * @brief Resolves a program name to an executable path
   *
   * Names containing a '/' are used as given, other names are looked up on PATH.
   */
  std::optional<std::string> find_program(const std::string &program);

  class ProcessToolRunner : public ToolRunner
  {
  public:
    ProcessToolRunner() = default;
    ~ProcessToolRunner() override = default;

    ProcessToolRunner(const ProcessToolRunner &) = delete;
    ProcessToolRunner &operator=(const ProcessToolRunner &) = delete;
    ProcessToolRunner(ProcessToolRunner &&) = delete;
    ProcessToolRunner &operator=(ProcessToolRunner &&) = delete;

    outcome::std_result<CommandOutput> run(const Command &command) override;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:tool_runner")};
  };

} // namespace relpack

#endif // RELPACK_PROCESS_TOOL_RUNNER_HH
