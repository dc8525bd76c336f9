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

#include "relpack/DiskImage.hh"

#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/Errors.hh"
#include "relpack/ToolRunner.hh"

namespace relpack
{
  namespace
  {
    class HdiutilDiskImageCreator : public DiskImageCreator
    {
    public:
      HdiutilDiskImageCreator(std::shared_ptr<ToolRunner> runner, std::string hdiutil_tool, std::string codesign_tool)
        : runner_(std::move(runner))
        , hdiutil_tool_(std::move(hdiutil_tool))
        , codesign_tool_(std::move(codesign_tool))
      {
      }

      outcome::std_result<void> create(const std::filesystem::path &bundle,
                                       const std::filesystem::path &disk_image,
                                       const std::string &volume_name,
                                       const std::string &signing_identity) override
      {
        std::error_code ec;
        std::filesystem::create_directories(disk_image.parent_path(), ec);
        if (ec)
          {
            logger_->error("Cannot create {}: {}", disk_image.parent_path().string(), ec.message());
            return PipelineError::DiskImageFailed;
          }

        logger_->info("Creating disk image {}", disk_image.string());
        Command create_command{hdiutil_tool_,
                               {"create", "-volname", volume_name, "-srcfolder", bundle.string(), "-ov", "-format", "UDZO", disk_image.string()}};
        auto created = run_step(create_command, "hdiutil create");
        if (!created)
          {
            return created.error();
          }

        logger_->info("Signing disk image");
        Command sign_command{codesign_tool_, {"--force", "--timestamp", "--sign", signing_identity, disk_image.string()}};
        return run_step(sign_command, "codesign");
      }

    private:
      outcome::std_result<void> run_step(const Command &command, const char *what)
      {
        logger_->debug("Running {}", command.describe());

        auto result = runner_->run(command);
        if (!result)
          {
            logger_->error("{} could not be started: {}", what, result.error().message());
            return PipelineError::DiskImageFailed;
          }

        if (!result.value().succeeded())
          {
            logger_->error("{} failed with exit code {}: {}", what, result.value().exit_code, result.value().output);
            return PipelineError::DiskImageFailed;
          }
        return outcome::success();
      }

      std::shared_ptr<ToolRunner> runner_;
      std::string hdiutil_tool_;
      std::string codesign_tool_;
      std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:disk_image")};
    };
  } // namespace

  std::shared_ptr<DiskImageCreator> DiskImageCreator::hdiutil(std::shared_ptr<ToolRunner> runner, std::string hdiutil_tool, std::string codesign_tool)
  {
    return std::make_shared<HdiutilDiskImageCreator>(std::move(runner), std::move(hdiutil_tool), std::move(codesign_tool));
  }

} // namespace relpack
