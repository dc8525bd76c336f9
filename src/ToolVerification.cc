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

#include "relpack/Verification.hh"

#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/ToolRunner.hh"

namespace relpack
{
  namespace
  {
    class SpctlOracle : public VerificationOracle
    {
    public:
      SpctlOracle(std::shared_ptr<ToolRunner> runner, std::string spctl_tool)
        : runner_(std::move(runner))
        , spctl_tool_(std::move(spctl_tool))
      {
      }

      bool accepts(const std::filesystem::path &artifact) override
      {
        Command command{spctl_tool_, {"-a", "-t", "open", "--context", "context:primary-signature", artifact.string()}};

        auto result = runner_->run(command);
        if (!result)
          {
            logger_->debug("Trust policy check not available: {}", result.error().message());
            return false;
          }

        if (!result.value().succeeded())
          {
            logger_->debug("Trust policy does not accept {} (exit code {})", artifact.string(), result.value().exit_code);
            return false;
          }
        return true;
      }

    private:
      std::shared_ptr<ToolRunner> runner_;
      std::string spctl_tool_;
      std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:oracle")};
    };

    class CodesignVerifier : public SignatureVerifier
    {
    public:
      CodesignVerifier(std::shared_ptr<ToolRunner> runner, std::string codesign_tool)
        : runner_(std::move(runner))
        , codesign_tool_(std::move(codesign_tool))
      {
      }

      bool verify(const std::filesystem::path &artifact) override
      {
        Command command{codesign_tool_, {"-v", artifact.string()}};

        auto result = runner_->run(command);
        if (!result)
          {
            logger_->error("Cannot verify code signature of {}: {}", artifact.string(), result.error().message());
            return false;
          }

        if (!result.value().succeeded())
          {
            logger_->error("Code signature of {} does not verify: {}", artifact.string(), result.value().output);
            return false;
          }
        return true;
      }

    private:
      std::shared_ptr<ToolRunner> runner_;
      std::string codesign_tool_;
      std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:signature")};
    };
  } // namespace

  std::shared_ptr<VerificationOracle> VerificationOracle::spctl(std::shared_ptr<ToolRunner> runner, std::string spctl_tool)
  {
    return std::make_shared<SpctlOracle>(std::move(runner), std::move(spctl_tool));
  }

  std::shared_ptr<SignatureVerifier> SignatureVerifier::codesign(std::shared_ptr<ToolRunner> runner, std::string codesign_tool)
  {
    return std::make_shared<CodesignVerifier>(std::move(runner), std::move(codesign_tool));
  }

} // namespace relpack
