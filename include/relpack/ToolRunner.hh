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

#ifndef RELPACK_TOOL_RUNNER_HH
#define RELPACK_TOOL_RUNNER_HH

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace relpack
{
  struct Command
  {
    std::string program;
    std::vector<std::string> arguments;
    std::map<std::string, std::string> environment;
    std::optional<std::filesystem::path> working_directory;

    // Values replaced by "****" whenever the command is described.
    std::vector<std::string> sensitive_values;

    std::string describe() const;
  };

  struct CommandOutput
  {
    int exit_code = -1;
    std::string output;

    bool succeeded() const
    {
      return exit_code == 0;
    }
  };

  /**
   * @brief Runs external tools to completion
   *
   * Standard output and standard error are merged into
   * CommandOutput::output. The environment entries of a Command are added
   * to the inherited process environment.
   */
  class ToolRunner
  {
  public:
    virtual ~ToolRunner() = default;

    /**
     * @brief Runs a command and waits for it to exit
     *
     * @return outcome::std_result<CommandOutput> The exit code and output,
     *         PipelineError::ToolLaunchFailed when the program cannot be
     *         found or started. A non-zero exit code is not an error here.
     */
    virtual outcome::std_result<CommandOutput> run(const Command &command) = 0;

    static std::shared_ptr<ToolRunner> instance();
  };

} // namespace relpack

#endif // RELPACK_TOOL_RUNNER_HH
