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

#include "relpack/Notarization.hh"

#include <optional>
#include <sstream>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/Errors.hh"
#include "relpack/ToolRunner.hh"

namespace relpack
{
  namespace
  {
    std::string trim(const std::string &value)
    {
      const auto first = value.find_first_not_of(" \t\r\n");
      if (first == std::string::npos)
        {
          return {};
        }
      const auto last = value.find_last_not_of(" \t\r\n");
      return value.substr(first, last - first + 1);
    }

    std::optional<NotarizationReceipt> parse_json_verdict(const std::string &output, const std::string &acceptance_marker)
    {
      const auto open = output.find('{');
      const auto close = output.rfind('}');
      if (open == std::string::npos || close == std::string::npos || close < open)
        {
          return std::nullopt;
        }

      boost::system::error_code ec;
      auto value = boost::json::parse(output.substr(open, close - open + 1), ec);
      if (ec || !value.is_object())
        {
          return std::nullopt;
        }

      const auto &obj = value.as_object();
      const auto *status = obj.find("status");
      if (status == obj.end() || !status->value().is_string())
        {
          return std::nullopt;
        }

      NotarizationReceipt receipt;
      receipt.status = std::string(status->value().as_string());
      receipt.accepted = receipt.status == acceptance_marker;
      if (const auto *id = obj.find("id"); id != obj.end() && id->value().is_string())
        {
          receipt.submission_id = std::string(id->value().as_string());
        }
      return receipt;
    }

    NotarizationReceipt parse_text_verdict(const std::string &output, const std::string &acceptance_marker)
    {
      NotarizationReceipt receipt;

      std::istringstream stream(output);
      std::string line;
      while (std::getline(stream, line))
        {
          const auto colon = line.find(':');
          if (colon == std::string::npos)
            {
              continue;
            }

          const auto key = trim(line.substr(0, colon));
          const auto value = trim(line.substr(colon + 1));
          if (key == "id" && receipt.submission_id.empty())
            {
              receipt.submission_id = value;
            }
          else if (key == "status")
            {
              receipt.status = value;
            }
        }

      if (!receipt.status.empty())
        {
          receipt.accepted = receipt.status == acceptance_marker;
          return receipt;
        }

      receipt.accepted = !acceptance_marker.empty() && output.find(acceptance_marker) != std::string::npos;
      if (receipt.accepted)
        {
          receipt.status = acceptance_marker;
        }
      return receipt;
    }
  } // namespace

  NotarizationReceipt parse_notary_verdict(const std::string &output, const std::string &acceptance_marker)
  {
    if (auto receipt = parse_json_verdict(output, acceptance_marker))
      {
        return *receipt;
      }
    return parse_text_verdict(output, acceptance_marker);
  }

  namespace
  {
    class NotarytoolClient : public NotaryClient
    {
    public:
      NotarytoolClient(std::shared_ptr<ToolRunner> runner, std::string xcrun_tool, std::string acceptance_marker)
        : runner_(std::move(runner))
        , xcrun_tool_(std::move(xcrun_tool))
        , acceptance_marker_(std::move(acceptance_marker))
      {
      }

      outcome::std_result<NotarizationReceipt> submit(const std::filesystem::path &artifact, const CredentialSet &credentials) override
      {
        Command command{xcrun_tool_,
                        {"notarytool",
                         "submit",
                         artifact.string(),
                         "--apple-id",
                         credentials.account_id,
                         "--password",
                         credentials.account_secret,
                         "--team-id",
                         credentials.organization_id,
                         "--wait",
                         "--output-format",
                         "json"}};
        command.sensitive_values = credentials.secrets();

        logger_->info("Submitting {} for notarization (this may take a few minutes)", artifact.filename().string());
        logger_->debug("Running {}", command.describe());

        auto result = runner_->run(command);
        if (!result)
          {
            logger_->error("Notarization service client could not be started: {}", result.error().message());
            return PipelineError::NotarizationRejected;
          }

        const auto &output = result.value();
        auto receipt = parse_notary_verdict(output.output, acceptance_marker_);
        if (!output.succeeded())
          {
            logger_->error("Notarization failed with exit code {}: {}", output.exit_code, output.output);
            return PipelineError::NotarizationRejected;
          }

        if (!receipt.accepted)
          {
            logger_->error("Notarization verdict is '{}', expected '{}' (submission {})", receipt.status, acceptance_marker_, receipt.submission_id);
            return PipelineError::NotarizationRejected;
          }

        logger_->info("Notarization accepted (submission {})", receipt.submission_id);
        return receipt;
      }

    private:
      std::shared_ptr<ToolRunner> runner_;
      std::string xcrun_tool_;
      std::string acceptance_marker_;
      std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:notary")};
    };

    class XcrunStapler : public Stapler
    {
    public:
      XcrunStapler(std::shared_ptr<ToolRunner> runner, std::string xcrun_tool)
        : runner_(std::move(runner))
        , xcrun_tool_(std::move(xcrun_tool))
      {
      }

      outcome::std_result<void> staple(const std::filesystem::path &artifact) override
      {
        Command command{xcrun_tool_, {"stapler", "staple", artifact.string()}};

        auto result = runner_->run(command);
        if (!result)
          {
            return result.error();
          }

        if (!result.value().succeeded())
          {
            logger_->debug("stapler exited with code {}: {}", result.value().exit_code, result.value().output);
            return PipelineError::StapleExhausted;
          }
        return outcome::success();
      }

    private:
      std::shared_ptr<ToolRunner> runner_;
      std::string xcrun_tool_;
      std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:stapler")};
    };
  } // namespace

  std::shared_ptr<NotaryClient> NotaryClient::notarytool(std::shared_ptr<ToolRunner> runner, std::string xcrun_tool, std::string acceptance_marker)
  {
    return std::make_shared<NotarytoolClient>(std::move(runner), std::move(xcrun_tool), std::move(acceptance_marker));
  }

  std::shared_ptr<Stapler> Stapler::xcrun(std::shared_ptr<ToolRunner> runner, std::string xcrun_tool)
  {
    return std::make_shared<XcrunStapler>(std::move(runner), std::move(xcrun_tool));
  }

} // namespace relpack
