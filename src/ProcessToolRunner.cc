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

#include "ProcessToolRunner.hh"

#include <filesystem>
#include <istream>
#include <boost/process.hpp>

#include "relpack/Errors.hh"

namespace bp = boost::process;

namespace relpack
{
  std::optional<std::string> find_program(const std::string &program)
  {
    if (program.empty())
      {
        return std::nullopt;
      }

    if (program.find('/') != std::string::npos)
      {
        return program;
      }

    auto path = bp::search_path(program);
    if (path.empty())
      {
        return std::nullopt;
      }
    return path.string();
  }

  outcome::std_result<CommandOutput> ProcessToolRunner::run(const Command &command)
  {
    auto executable = find_program(command.program);
    if (!executable)
      {
        logger_->error("Program not found: {}", command.program);
        return PipelineError::ToolLaunchFailed;
      }

    logger_->debug("Running: {}", command.describe());

    try
      {
        bp::environment env = boost::this_process::environment();
        for (const auto &[name, value]: command.environment)
          {
            env[name] = value;
          }

        auto start_dir = command.working_directory.value_or(std::filesystem::current_path());

        bp::ipstream output_stream;
        bp::child child(bp::exe = *executable,
                        bp::args = command.arguments,
                        env,
                        bp::start_dir = start_dir.string(),
                        (bp::std_out & bp::std_err) > output_stream);

        CommandOutput result;
        std::string line;
        while (std::getline(output_stream, line))
          {
            result.output += line;
            result.output += '\n';
          }

        child.wait();
        result.exit_code = child.exit_code();

        logger_->debug("{} exited with code {}", command.program, result.exit_code);
        return result;
      }
    catch (const bp::process_error &e)
      {
        logger_->error("Failed to run {}: {}", command.program, e.what());
        return PipelineError::ToolLaunchFailed;
      }
    catch (const std::exception &e)
      {
        logger_->error("Error while running {}: {}", command.program, e.what());
        return PipelineError::SystemError;
      }
  }

} // namespace relpack
