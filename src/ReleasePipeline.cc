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

#include "relpack/ReleasePipeline.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/Errors.hh"
#include "relpack/ToolRunner.hh"

namespace relpack
{
  Collaborators Collaborators::system(const PipelineConfig &config)
  {
    auto runner = ToolRunner::instance();
    auto sleeper = Sleeper::system();

    Collaborators collaborators;
    collaborators.environment = Environment::process();
    collaborators.identity_probe = IdentityProbe::security(runner, config.tools.security);
    collaborators.supervisor = BuildSupervisor::instance(config);
    collaborators.probe = ArtifactProbe::filesystem(sleeper);
    collaborators.oracle = VerificationOracle::spctl(runner, config.tools.spctl);
    collaborators.signature_verifier = SignatureVerifier::codesign(runner, config.tools.codesign);
    collaborators.notary = NotaryClient::notarytool(runner, config.tools.xcrun, config.notarization.acceptance_marker);
    collaborators.stapler = Stapler::xcrun(runner, config.tools.xcrun);
    collaborators.disk_image_creator = DiskImageCreator::hdiutil(runner, config.tools.hdiutil, config.tools.codesign);
    collaborators.sleeper = sleeper;
    return collaborators;
  }

  class ReleasePipeline::Impl
  {
  public:
    Impl(PipelineConfig config, Collaborators collaborators)
      : config_(std::move(config))
      , collaborators_(std::move(collaborators))
    {
    }

    outcome::std_result<PublishResult> run()
    {
      report_ = RunReport{};

      auto credentials = resolve_credentials();
      if (!credentials)
        {
          return credentials.error();
        }

      auto handle = build(credentials.value());
      if (!handle)
        {
          return handle.error();
        }

      auto artifact = validate_outputs(*handle.value(), credentials.value());
      if (!artifact)
        {
          return artifact.error();
        }

      if (config_.notarization.enabled)
        {
          NotarizationStage notarization(config_.notarization,
                                         collaborators_.oracle,
                                         collaborators_.notary,
                                         collaborators_.stapler,
                                         collaborators_.sleeper);
          auto notarized = notarization.run(artifact.value(), credentials.value());
          if (!notarized)
            {
              return notarized.error();
            }
          report_.notarization = notarized.value();
          report_.warnings.insert(report_.warnings.end(), notarized.value().warnings.begin(), notarized.value().warnings.end());
        }
      else
        {
          logger_->info("Notarization disabled, skipping submission");
        }

      PublishStage publish(collaborators_.signature_verifier, collaborators_.oracle, collaborators_.sleeper);
      auto published = publish.run(artifact.value(), config_.publish_directory, report_.warnings);
      if (!published)
        {
          return published.error();
        }
      report_.publish = published.value();

      if (report_.warnings.empty())
        {
          logger_->info("Release completed");
        }
      else
        {
          logger_->warn("Release completed with {} warning(s)", report_.warnings.size());
        }
      return published.value();
    }

    const RunReport &report() const
    {
      return report_;
    }

  private:
    outcome::std_result<CredentialSet> resolve_credentials()
    {
      CredentialResolver resolver(collaborators_.environment,
                                  config_.credentials.env_file,
                                  collaborators_.identity_probe,
                                  config_.credentials.identity_class);
      auto credentials = resolver.resolve();
      if (!credentials)
        {
          report_.missing_credentials = resolver.missing();
        }
      return credentials;
    }

    outcome::std_result<BuildHandle> build(const CredentialSet &credentials)
    {
      logger_->info("Building {} {} ({})", config_.product.name, config_.product.version, config_.product.arch);

      auto handle = collaborators_.supervisor->launch(credentials);
      if (!handle)
        {
          logger_->error("Cannot start the builder: {}", handle.error().message());
          return handle.error();
        }

      auto poll_settings = config_.poll;
      poll_settings.ignore_stale_outputs = config_.reject_stale_artifacts;

      DualConditionPoller poller(poll_settings,
                                 collaborators_.supervisor,
                                 collaborators_.probe,
                                 collaborators_.oracle,
                                 collaborators_.sleeper,
                                 config_.builder.produces_disk_image);
      report_.poll = poller.run(handle.value());

      const auto &poll = *report_.poll;
      logger_->info("Build monitoring finished in state {} after {}s", to_string(poll.state), poll.elapsed.count());
      if (poll.exit_status && !poll.exit_status->terminated && poll.exit_status->exit_code != 0)
        {
          logger_->warn("Builder exited with code {}; checking its outputs anyway", poll.exit_status->exit_code);
        }
      if (poll.state == PollState::TimedOut)
        {
          logger_->warn("Builder is still running after the deadline; it is left running");
        }
      return handle;
    }

    outcome::std_result<std::filesystem::path> validate_outputs(const BuildTask &task, const CredentialSet &credentials)
    {
      BuildOutputValidator validator(collaborators_.probe, config_.reject_stale_artifacts);

      auto bundle = validator.validate_bundle(task);
      if (!bundle)
        {
          return bundle.error();
        }
      logger_->info("Application bundle: {}", task.expected_bundle_path().string());

      if (!config_.builder.produces_disk_image)
        {
          auto created = collaborators_.disk_image_creator->create(task.expected_bundle_path(),
                                                                   task.expected_artifact_path(),
                                                                   config_.product.name,
                                                                   credentials.signing_identity);
          if (!created)
            {
              return created.error();
            }
        }

      auto artifact = validator.validate_artifact(task);
      if (!artifact)
        {
          return artifact.error();
        }
      logger_->info("Artifact: {}", task.expected_artifact_path().string());
      return task.expected_artifact_path();
    }

    PipelineConfig config_;
    Collaborators collaborators_;
    RunReport report_;
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:pipeline")};
  };

  ReleasePipeline::ReleasePipeline(PipelineConfig config, Collaborators collaborators)
    : pimpl(std::make_unique<Impl>(std::move(config), std::move(collaborators)))
  {
  }

  ReleasePipeline::~ReleasePipeline() = default;
  ReleasePipeline::ReleasePipeline(ReleasePipeline &&) noexcept = default;
  ReleasePipeline &ReleasePipeline::operator=(ReleasePipeline &&) noexcept = default;

  outcome::std_result<PublishResult> ReleasePipeline::run()
  {
    return pimpl->run();
  }

  const RunReport &ReleasePipeline::report() const
  {
    return pimpl->report();
  }

  std::string remediation_for(const std::error_code &error, const PipelineConfig &config)
  {
    const auto artifact = config.artifact_path().string();

    if (error == PipelineError::MissingCredential)
      {
        return fmt::format("Set the missing variables in the environment or in {}.\n"
                           "List the installed signing identities with: {} find-identity -v -p codesigning",
                           config.credentials.env_file ? config.credentials.env_file->string() : std::string("an env file"),
                           config.tools.security);
      }
    if (error == PipelineError::BuildArtifactMissing)
      {
        return fmt::format("Expected the application bundle at {} and the artifact at {}.\n"
                           "Check the builder output, remove stale outputs and run '{}' manually in {}.",
                           config.bundle_path().string(),
                           artifact,
                           fmt::join(config.builder.command, " "),
                           config.builder.working_directory.string());
      }
    if (error == PipelineError::NotarizationRejected)
      {
        return fmt::format("Inspect the notarization log with: {} notarytool log <submission-id> "
                           "--apple-id $APPLE_ID --password $APPLE_PASSWORD --team-id $APPLE_TEAM_ID",
                           config.tools.xcrun);
      }
    if (error == PipelineError::SignatureInvalid)
      {
        return fmt::format("Inspect the signature with: {} -dv --verbose=4 \"{}\"", config.tools.codesign, artifact);
      }
    if (error == PipelineError::NotarizationUnverified)
      {
        return fmt::format("Check the trust policy with: {} -a -t open --context context:primary-signature \"{}\"", config.tools.spctl, artifact);
      }
    if (error == PipelineError::StapleExhausted)
      {
        return fmt::format("Staple the ticket later with: {} stapler staple \"{}\"", config.tools.xcrun, artifact);
      }
    if (error == PipelineError::DiskImageFailed)
      {
        return fmt::format("Create the disk image manually with: {} create -volname \"{}\" -srcfolder \"{}\" -ov -format UDZO \"{}\"",
                           config.tools.hdiutil,
                           config.product.name,
                           config.bundle_path().string(),
                           artifact);
      }
    if (error == PipelineError::PublishFailed)
      {
        return fmt::format("Copy \"{}\" to {} manually and check the permissions of that directory.", artifact, config.publish_directory.string());
      }
    if (error == PipelineError::InvalidConfiguration)
      {
        return "Fix the configuration file; the log above names the offending field.";
      }
    if (error == PipelineError::ToolLaunchFailed)
      {
        return "Make sure the Xcode command line tools and the builder are installed and on PATH.";
      }
    return {};
  }

} // namespace relpack
