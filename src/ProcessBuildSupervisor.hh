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

#ifndef RELPACK_PROCESS_BUILD_SUPERVISOR_HH
#define RELPACK_PROCESS_BUILD_SUPERVISOR_HH

#include <filesystem>
#include <map>
#include <memory>
#include <boost/outcome/std_result.hpp>
#include <boost/process/child.hpp>
#include <boost/process/group.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/BuildSupervisor.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  /**
   * @brief Runs the builder as a child process in its own process group
   *
   * Terminating a build signals the whole group, so helper processes
   * spawned by the builder are stopped as well.
   */
  class ProcessBuildSupervisor : public BuildSupervisor
  {
  public:
    ProcessBuildSupervisor(BuilderSettings settings, std::filesystem::path bundle_path, std::filesystem::path artifact_path);
    ~ProcessBuildSupervisor() override;

    ProcessBuildSupervisor(const ProcessBuildSupervisor &) = delete;
    ProcessBuildSupervisor &operator=(const ProcessBuildSupervisor &) = delete;
    ProcessBuildSupervisor(ProcessBuildSupervisor &&) = delete;
    ProcessBuildSupervisor &operator=(ProcessBuildSupervisor &&) = delete;

    outcome::std_result<BuildHandle> launch(const CredentialSet &credentials) override;
    bool is_alive(const BuildHandle &handle) override;
    outcome::std_result<void> terminate(const BuildHandle &handle) override;
    ExitStatus join(const BuildHandle &handle) override;

  private:
    struct Process
    {
      boost::process::group group;
      boost::process::child child;
    };

    Process *find(const BuildHandle &handle);
    void release(const BuildHandle &handle);

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:build_supervisor")};
    BuilderSettings settings_;
    std::filesystem::path bundle_path_;
    std::filesystem::path artifact_path_;
    std::map<int, std::unique_ptr<Process>> processes_;
    int next_id_{1};
  };

} // namespace relpack

#endif // RELPACK_PROCESS_BUILD_SUPERVISOR_HH
