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

#include "relpack/DualConditionPoller.hh"

#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "Policy.hh"
#include "relpack/Errors.hh"

namespace relpack
{
  namespace
  {
    // Rewritten by every build, unlike the bundle directory itself.
    std::filesystem::path bundle_stamp(const std::filesystem::path &bundle)
    {
      return bundle / "Contents" / "Info.plist";
    }

    bool is_fresh(ArtifactProbe &probe, const std::filesystem::path &path, const BuildTask &task)
    {
      auto modified = probe.modification_time(path);
      return modified && *modified >= task.start_file_time();
    }
  } // namespace

  const char *to_string(PollState state)
  {
    switch (state)
      {
      case PollState::Waiting:
        return "Waiting";
      case PollState::ArtifactSeen:
        return "ArtifactSeen";
      case PollState::Notarized:
        return "Notarized";
      case PollState::Done:
        return "Done";
      case PollState::TimedOut:
        return "TimedOut";
      case PollState::ProcessExited:
        return "ProcessExited";
      }
    return "Unknown";
  }

  bool is_terminal(PollState state)
  {
    return state == PollState::Done || state == PollState::TimedOut || state == PollState::ProcessExited;
  }

  // =============================================================================
  // DualConditionPoller
  // =============================================================================

  class DualConditionPoller::Impl
  {
  public:
    Impl(PollSettings settings,
         std::shared_ptr<BuildSupervisor> supervisor,
         std::shared_ptr<ArtifactProbe> probe,
         std::shared_ptr<VerificationOracle> oracle,
         std::shared_ptr<Sleeper> sleeper,
         bool watch_artifact)
      : settings_(settings)
      , supervisor_(std::move(supervisor))
      , probe_(std::move(probe))
      , oracle_(std::move(oracle))
      , sleeper_(std::move(sleeper))
      , watch_artifact_(watch_artifact)
    {
    }

    PollContext run(const BuildHandle &handle)
    {
      PollContext context;
      std::chrono::seconds last_heartbeat{0};

      logger_->info("Waiting for build {} (poll every {}s, deadline {}s)",
                    handle->id(),
                    settings_.interval.count(),
                    settings_.deadline.count());
      if (watch_artifact_)
        {
          logger_->debug("Watching for {}", handle->expected_artifact_path().string());
        }

      while (!is_terminal(context.state))
        {
          if (context.elapsed >= settings_.deadline)
            {
              transition(context, PollState::TimedOut);
              logger_->warn("Build did not complete within {}s; falling through to output validation", settings_.deadline.count());
              break;
            }

          tick(context, handle);
          if (is_terminal(context.state))
            {
              break;
            }

          sleeper_->sleep_for(settings_.interval);
          context.elapsed += settings_.interval;

          if (settings_.heartbeat.count() > 0 && context.elapsed - last_heartbeat >= settings_.heartbeat)
            {
              last_heartbeat = context.elapsed;
              context.heartbeats++;
              logger_->info("Still building... ({}s elapsed, state {})", context.elapsed.count(), to_string(context.state));
            }
        }

      return context;
    }

    void tick(PollContext &context, const BuildHandle &handle)
    {
      if (is_terminal(context.state))
        {
          return;
        }

      if (!supervisor_->is_alive(handle))
        {
          context.exit_status = supervisor_->join(handle);
          logger_->info("Builder exited with code {} after {}s", context.exit_status->exit_code, context.elapsed.count());
          transition(context, PollState::ProcessExited);
          return;
        }

      if (context.state == PollState::Waiting)
        {
          if (!context.artifacts.bundle_present() && probe_->bundle_exists(handle->expected_bundle_path())
              && observable(bundle_stamp(handle->expected_bundle_path()), *handle))
            {
              context.artifacts.mark_bundle_present();
              logger_->info("Application bundle created: {}", handle->expected_bundle_path().string());
            }

          if (watch_artifact_ && probe_->artifact_exists(handle->expected_artifact_path())
              && observable(handle->expected_artifact_path(), *handle))
            {
              context.artifacts.mark_artifact_present();
              logger_->info("Artifact created: {}", handle->expected_artifact_path().string());
              transition(context, PollState::ArtifactSeen);
            }
          return;
        }

      if (context.state == PollState::ArtifactSeen && oracle_->accepts(handle->expected_artifact_path()))
        {
          context.artifacts.mark_notarized();
          logger_->info("Artifact is notarized; stopping the builder");
          transition(context, PollState::Notarized);

          context.terminate_requests++;
          std::vector<std::error_code> ignored;
          auto terminated = degrade(supervisor_->terminate(handle), ignored, *logger_, "Terminating builder");
          if (!terminated)
            {
              logger_->warn("Builder could not be stopped: {}", terminated.error().message());
            }

          context.exit_status = supervisor_->join(handle);
          transition(context, PollState::Done);
        }
    }

  private:
    bool observable(const std::filesystem::path &path, const BuildTask &task)
    {
      if (!settings_.ignore_stale_outputs || is_fresh(*probe_, path, task))
        {
          return true;
        }

      if (!stale_reported_)
        {
          stale_reported_ = true;
          logger_->info("Ignoring {}, it predates the start of build {}", path.string(), task.id());
        }
      return false;
    }

    void transition(PollContext &context, PollState to)
    {
      if (!can_transition(context.state, to))
        {
          logger_->error("Ignoring invalid transition {} -> {}", to_string(context.state), to_string(to));
          return;
        }

      logger_->debug("{} -> {} at {}s", to_string(context.state), to_string(to), context.elapsed.count());
      context.state = to;
      context.trace.push_back(PollEvent{to, context.elapsed, context.artifacts});
    }

    PollSettings settings_;
    std::shared_ptr<BuildSupervisor> supervisor_;
    std::shared_ptr<ArtifactProbe> probe_;
    std::shared_ptr<VerificationOracle> oracle_;
    std::shared_ptr<Sleeper> sleeper_;
    bool watch_artifact_;
    bool stale_reported_{false};
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:poller")};
  };

  DualConditionPoller::DualConditionPoller(PollSettings settings,
                                           std::shared_ptr<BuildSupervisor> supervisor,
                                           std::shared_ptr<ArtifactProbe> probe,
                                           std::shared_ptr<VerificationOracle> oracle,
                                           std::shared_ptr<Sleeper> sleeper,
                                           bool watch_artifact)
    : pimpl(std::make_unique<Impl>(settings, std::move(supervisor), std::move(probe), std::move(oracle), std::move(sleeper), watch_artifact))
  {
  }

  DualConditionPoller::~DualConditionPoller() = default;
  DualConditionPoller::DualConditionPoller(DualConditionPoller &&) noexcept = default;
  DualConditionPoller &DualConditionPoller::operator=(DualConditionPoller &&) noexcept = default;

  PollContext DualConditionPoller::run(const BuildHandle &handle)
  {
    return pimpl->run(handle);
  }

  void DualConditionPoller::tick(PollContext &context, const BuildHandle &handle)
  {
    pimpl->tick(context, handle);
  }

  bool DualConditionPoller::can_transition(PollState from, PollState to)
  {
    switch (from)
      {
      case PollState::Waiting:
        return to == PollState::ArtifactSeen || to == PollState::ProcessExited || to == PollState::TimedOut;
      case PollState::ArtifactSeen:
        return to == PollState::Notarized || to == PollState::ProcessExited || to == PollState::TimedOut;
      case PollState::Notarized:
        return to == PollState::Done;
      case PollState::Done:
      case PollState::TimedOut:
      case PollState::ProcessExited:
        return false;
      }
    return false;
  }

  // =============================================================================
  // BuildOutputValidator
  // =============================================================================

  namespace
  {
    std::shared_ptr<spdlog::logger> validator_logger()
    {
      static auto logger = Logging::create("relpack:output_validator");
      return logger;
    }
  } // namespace

  BuildOutputValidator::BuildOutputValidator(std::shared_ptr<ArtifactProbe> probe, bool reject_stale_artifacts)
    : probe_(std::move(probe))
    , reject_stale_artifacts_(reject_stale_artifacts)
  {
  }

  outcome::std_result<void> BuildOutputValidator::validate_bundle(const BuildTask &task) const
  {
    const auto &bundle = task.expected_bundle_path();
    if (!probe_->bundle_exists(bundle))
      {
        validator_logger()->error("Application bundle not found or not a valid bundle: {}", bundle.string());
        return PipelineError::BuildArtifactMissing;
      }

    if (reject_stale_artifacts_ && !is_fresh(*probe_, bundle_stamp(bundle), task))
      {
        validator_logger()->error("Application bundle is stale, it predates the start of build {}: {}", task.id(), bundle.string());
        return PipelineError::BuildArtifactMissing;
      }
    validator_logger()->debug("Application bundle present: {}", bundle.string());
    return outcome::success();
  }

  outcome::std_result<void> BuildOutputValidator::validate_artifact(const BuildTask &task) const
  {
    const auto &artifact = task.expected_artifact_path();
    if (!probe_->artifact_exists(artifact))
      {
        validator_logger()->error("Artifact not found: {}", artifact.string());
        return PipelineError::BuildArtifactMissing;
      }

    if (reject_stale_artifacts_)
      {
        auto modified = probe_->modification_time(artifact);
        if (!modified)
          {
            validator_logger()->error("Cannot determine the age of {}", artifact.string());
            return PipelineError::BuildArtifactMissing;
          }
        if (*modified < task.start_file_time())
          {
            validator_logger()->error("Artifact is stale, it predates the start of build {}: {}", task.id(), artifact.string());
            return PipelineError::BuildArtifactMissing;
          }
      }

    validator_logger()->debug("Artifact present: {}", artifact.string());
    return outcome::success();
  }

  outcome::std_result<void> BuildOutputValidator::validate(const BuildTask &task) const
  {
    auto bundle = validate_bundle(task);
    if (!bundle)
      {
        return bundle.error();
      }
    return validate_artifact(task);
  }

} // namespace relpack
