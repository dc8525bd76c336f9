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

#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "Policy.hh"
#include "relpack/Errors.hh"

namespace relpack
{
  class NotarizationStage::Impl
  {
  public:
    Impl(NotarizationSettings settings,
         std::shared_ptr<VerificationOracle> oracle,
         std::shared_ptr<NotaryClient> notary,
         std::shared_ptr<Stapler> stapler,
         std::shared_ptr<Sleeper> sleeper)
      : settings_(std::move(settings))
      , oracle_(std::move(oracle))
      , notary_(std::move(notary))
      , stapler_(std::move(stapler))
      , sleeper_(std::move(sleeper))
    {
    }

    outcome::std_result<NotarizationReport> run(const std::filesystem::path &artifact, const CredentialSet &credentials)
    {
      NotarizationReport report;

      if (oracle_->accepts(artifact))
        {
          logger_->info("{} is already notarized, skipping submission", artifact.filename().string());
          report.already_notarized = true;
          return report;
        }

      auto receipt = notary_->submit(artifact, credentials);
      if (!receipt)
        {
          return receipt.error();
        }
      report.submitted = true;
      report.submission_id = receipt.value().submission_id;

      auto stapled = degrade(staple(artifact, report), report.warnings, *logger_, "Stapling notarization ticket");
      if (!stapled)
        {
          return stapled.error();
        }
      return report;
    }

  private:
    outcome::std_result<void> staple(const std::filesystem::path &artifact, NotarizationReport &report)
    {
      logger_->info("Waiting {}s for the notarization ticket to propagate", settings_.staple_grace.count());
      sleeper_->sleep_for(settings_.staple_grace);

      for (int attempt = 1; attempt <= settings_.staple_attempts; ++attempt)
        {
          report.staple_attempts = attempt;

          auto result = stapler_->staple(artifact);
          if (result)
            {
              logger_->info("Notarization ticket stapled on attempt {}", attempt);
              report.stapled = true;
              return outcome::success();
            }

          logger_->info("Staple attempt {}/{} failed: {}", attempt, settings_.staple_attempts, result.error().message());
          if (attempt < settings_.staple_attempts)
            {
              sleeper_->sleep_for(settings_.staple_backoff);
            }
        }

      logger_->warn("Stapling failed after {} attempts; the artifact can still be verified online", settings_.staple_attempts);
      return PipelineError::StapleExhausted;
    }

    NotarizationSettings settings_;
    std::shared_ptr<VerificationOracle> oracle_;
    std::shared_ptr<NotaryClient> notary_;
    std::shared_ptr<Stapler> stapler_;
    std::shared_ptr<Sleeper> sleeper_;
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:notarization")};
  };

  NotarizationStage::NotarizationStage(NotarizationSettings settings,
                                       std::shared_ptr<VerificationOracle> oracle,
                                       std::shared_ptr<NotaryClient> notary,
                                       std::shared_ptr<Stapler> stapler,
                                       std::shared_ptr<Sleeper> sleeper)
    : pimpl(std::make_unique<Impl>(std::move(settings), std::move(oracle), std::move(notary), std::move(stapler), std::move(sleeper)))
  {
  }

  NotarizationStage::~NotarizationStage() = default;
  NotarizationStage::NotarizationStage(NotarizationStage &&) noexcept = default;
  NotarizationStage &NotarizationStage::operator=(NotarizationStage &&) noexcept = default;

  outcome::std_result<NotarizationReport> NotarizationStage::run(const std::filesystem::path &artifact, const CredentialSet &credentials)
  {
    return pimpl->run(artifact, credentials);
  }

} // namespace relpack
