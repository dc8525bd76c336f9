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

#include "relpack/BuildSupervisor.hh"

#include "ProcessBuildSupervisor.hh"

namespace relpack
{
  BuildTask::BuildTask(int id, std::filesystem::path expected_bundle_path, std::filesystem::path expected_artifact_path)
    : id_(id)
    , start_time_(std::chrono::system_clock::now())
    , start_file_time_(std::filesystem::file_time_type::clock::now())
    , expected_bundle_path_(std::move(expected_bundle_path))
    , expected_artifact_path_(std::move(expected_artifact_path))
  {
  }

  bool BuildTask::mark_completed(int exit_code)
  {
    if (retired())
      {
        return false;
      }
    lifecycle_ = Lifecycle::Completed;
    exit_status_ = ExitStatus{exit_code, false};
    return true;
  }

  bool BuildTask::mark_terminated()
  {
    if (retired())
      {
        return false;
      }
    lifecycle_ = Lifecycle::Terminated;
    exit_status_ = ExitStatus{-1, true};
    return true;
  }

  std::shared_ptr<BuildSupervisor> BuildSupervisor::instance(const PipelineConfig &config)
  {
    return std::make_shared<ProcessBuildSupervisor>(config.builder, config.bundle_path(), config.artifact_path());
  }

} // namespace relpack
