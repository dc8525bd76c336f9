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

#include "ProcessBuildSupervisor.hh"

#include <cerrno>
#include <signal.h>
#include <string>
#include <vector>
#include <boost/process.hpp>

#include "ProcessToolRunner.hh"
#include "relpack/Errors.hh"
#include "relpack/ToolRunner.hh"

namespace bp = boost::process;

namespace relpack
{
  ProcessBuildSupervisor::ProcessBuildSupervisor(BuilderSettings settings, std::filesystem::path bundle_path, std::filesystem::path artifact_path)
    : settings_(std::move(settings))
    , bundle_path_(std::move(bundle_path))
    , artifact_path_(std::move(artifact_path))
  {
  }

  ProcessBuildSupervisor::~ProcessBuildSupervisor()
  {
    // A build still running here was abandoned by the caller (deadline
    // reached); it is left running and only detached.
    for (auto &[id, process]: processes_)
      {
        std::error_code ec;
        if (process->child.running(ec))
          {
            logger_->warn("Builder (pid {}) is still running, detaching", process->child.id());
            process->group.detach();
            process->child.detach();
          }
      }
  }

  outcome::std_result<BuildHandle> ProcessBuildSupervisor::launch(const CredentialSet &credentials)
  {
    if (settings_.command.empty())
      {
        logger_->error("No builder command configured");
        return PipelineError::InvalidConfiguration;
      }

    auto executable = find_program(settings_.command.front());
    if (!executable)
      {
        logger_->error("Builder program not found: {}", settings_.command.front());
        return PipelineError::ToolLaunchFailed;
      }

    std::vector<std::string> arguments(settings_.command.begin() + 1, settings_.command.end());

    bp::environment env = boost::this_process::environment();
    for (const auto &[name, value]: credentials.as_environment())
      {
        env[name] = value;
      }

    auto task = std::make_shared<BuildTask>(next_id_++, bundle_path_, artifact_path_);
    auto process = std::make_unique<Process>();

    try
      {
        process->child = bp::child(bp::exe = *executable,
                                   bp::args = arguments,
                                   env,
                                   bp::start_dir = settings_.working_directory.string(),
                                   process->group);
      }
    catch (const bp::process_error &e)
      {
        logger_->error("Failed to launch builder {}: {}", *executable, e.what());
        return PipelineError::ToolLaunchFailed;
      }

    logger_->info("Launched builder (pid {}): {}", process->child.id(), Command{settings_.command.front(), arguments}.describe());
    processes_.emplace(task->id(), std::move(process));
    return task;
  }

  bool ProcessBuildSupervisor::is_alive(const BuildHandle &handle)
  {
    if (handle->retired())
      {
        return false;
      }

    auto *process = find(handle);
    if (process == nullptr)
      {
        return false;
      }

    std::error_code ec;
    bool running = process->child.running(ec);
    if (ec)
      {
        logger_->warn("Cannot query builder state: {}", ec.message());
        return true;
      }

    if (!running)
      {
        handle->mark_completed(process->child.exit_code());
        release(handle);
      }
    return running;
  }

  outcome::std_result<void> ProcessBuildSupervisor::terminate(const BuildHandle &handle)
  {
    auto *process = find(handle);
    if (handle->retired() || process == nullptr)
      {
        return PipelineError::TerminationFailed;
      }

    std::error_code ec;
    if (::killpg(process->group.native_handle(), SIGTERM) != 0)
      {
        int signal_error = errno;
        logger_->debug("Cannot signal builder process group: {}", std::generic_category().message(signal_error));

        // Most likely the builder already exited; reap it.
        process->child.wait(ec);
        handle->mark_completed(ec ? -1 : process->child.exit_code());
        release(handle);
        return PipelineError::TerminationFailed;
      }

    if (!process->child.wait_for(settings_.terminate_grace, ec))
      {
        logger_->warn("Builder did not stop within {}s, killing it", settings_.terminate_grace.count());
        process->group.terminate(ec);
        process->child.wait(ec);
      }

    logger_->info("Builder terminated");
    handle->mark_terminated();
    release(handle);
    return outcome::success();
  }

  ExitStatus ProcessBuildSupervisor::join(const BuildHandle &handle)
  {
    if (!handle->retired())
      {
        auto *process = find(handle);
        if (process != nullptr)
          {
            std::error_code ec;
            process->child.wait(ec);
            if (ec)
              {
                logger_->warn("Failed to wait for builder: {}", ec.message());
              }
            handle->mark_completed(ec ? -1 : process->child.exit_code());
            release(handle);
          }
        else
          {
            handle->mark_completed(-1);
          }
      }

    return *handle->exit_status();
  }

  ProcessBuildSupervisor::Process *ProcessBuildSupervisor::find(const BuildHandle &handle)
  {
    auto it = processes_.find(handle->id());
    if (it == processes_.end())
      {
        return nullptr;
      }
    return it->second.get();
  }

  void ProcessBuildSupervisor::release(const BuildHandle &handle)
  {
    processes_.erase(handle->id());
  }

} // namespace relpack
