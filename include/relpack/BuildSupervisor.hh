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

#ifndef RELPACK_BUILD_SUPERVISOR_HH
#define RELPACK_BUILD_SUPERVISOR_HH

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <boost/outcome/std_result.hpp>

#include "relpack/Config.hh"
#include "relpack/Credentials.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  struct ExitStatus
  {
    int exit_code = 0;
    bool terminated = false;

    bool succeeded() const
    {
      return !terminated && exit_code == 0;
    }
  };

  /**
   * @brief A supervised run of the builder tool
   *
   * A task starts Running and is retired exactly once, either as
   * Completed with the exit code of the builder, or as Terminated when the
   * supervisor killed it.
   */
  class BuildTask
  {
  public:
    enum class Lifecycle
    {
      Running,
      Completed,
      Terminated,
    };

    BuildTask(int id, std::filesystem::path expected_bundle_path, std::filesystem::path expected_artifact_path);

    int id() const
    {
      return id_;
    }

    std::chrono::system_clock::time_point start_time() const
    {
      return start_time_;
    }

    // Start time on the clock used for file modification times.
    std::filesystem::file_time_type start_file_time() const
    {
      return start_file_time_;
    }

    const std::filesystem::path &expected_bundle_path() const
    {
      return expected_bundle_path_;
    }

    const std::filesystem::path &expected_artifact_path() const
    {
      return expected_artifact_path_;
    }

    Lifecycle lifecycle() const
    {
      return lifecycle_;
    }

    bool retired() const
    {
      return lifecycle_ != Lifecycle::Running;
    }

    std::optional<ExitStatus> exit_status() const
    {
      return exit_status_;
    }

    // Return false when the task was already retired.
    bool mark_completed(int exit_code);
    bool mark_terminated();

  private:
    int id_;
    std::chrono::system_clock::time_point start_time_;
    std::filesystem::file_time_type start_file_time_;
    std::filesystem::path expected_bundle_path_;
    std::filesystem::path expected_artifact_path_;
    Lifecycle lifecycle_{Lifecycle::Running};
    std::optional<ExitStatus> exit_status_;
  };

  using BuildHandle = std::shared_ptr<BuildTask>;

  /**
   * @brief Owns the lifecycle of the builder child process
   *
   * @par Example Usage
   * @code
   * auto supervisor = relpack::BuildSupervisor::instance(config);
   * auto handle = supervisor->launch(credentials);
   * while (supervisor->is_alive(handle.value())) { ... }
   * auto status = supervisor->join(handle.value());
   * @endcode
   */
  class BuildSupervisor
  {
  public:
    virtual ~BuildSupervisor() = default;

    /**
     * @brief Starts the builder without waiting for it
     *
     * The credentials are added to the environment of the child process
     * only; the environment of the orchestrator is left untouched.
     *
     * @return outcome::std_result<BuildHandle> Handle of the running build,
     *         PipelineError::ToolLaunchFailed if the builder cannot start
     */
    virtual outcome::std_result<BuildHandle> launch(const CredentialSet &credentials) = 0;

    /**
     * @brief Non-blocking liveness check
     */
    virtual bool is_alive(const BuildHandle &handle) = 0;

    /**
     * @brief Signals the builder to stop and reaps it
     *
     * @return outcome::std_result<void> PipelineError::TerminationFailed when
     *         the process could not be signalled, typically because it has
     *         already exited. Callers treat this as best-effort.
     */
    virtual outcome::std_result<void> terminate(const BuildHandle &handle) = 0;

    /**
     * @brief Blocks until the builder exits
     *
     * Safe to call after terminate(); the recorded status is returned.
     */
    virtual ExitStatus join(const BuildHandle &handle) = 0;

    static std::shared_ptr<BuildSupervisor> instance(const PipelineConfig &config);
  };

} // namespace relpack

#endif // RELPACK_BUILD_SUPERVISOR_HH
