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

#ifndef RELPACK_DUAL_CONDITION_POLLER_HH
#define RELPACK_DUAL_CONDITION_POLLER_HH

#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "relpack/ArtifactProbe.hh"
#include "relpack/BuildSupervisor.hh"
#include "relpack/Config.hh"
#include "relpack/Sleeper.hh"
#include "relpack/Verification.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  enum class PollState
  {
    Waiting,
    ArtifactSeen,
    Notarized,
    Done,
    TimedOut,
    ProcessExited,
  };

  const char *to_string(PollState state);
  bool is_terminal(PollState state);

  /**
   * @brief Monotonic snapshot of what the poller has observed
   *
   * Flags can only be raised. Once a flag is true it stays true for the
   * rest of the run.
   */
  class ArtifactState
  {
  public:
    bool bundle_present() const
    {
      return bundle_present_;
    }

    bool artifact_present() const
    {
      return artifact_present_;
    }

    bool notarized() const
    {
      return notarized_;
    }

    void mark_bundle_present()
    {
      bundle_present_ = true;
    }

    void mark_artifact_present()
    {
      artifact_present_ = true;
    }

    void mark_notarized()
    {
      notarized_ = true;
    }

  private:
    bool bundle_present_{false};
    bool artifact_present_{false};
    bool notarized_{false};
  };

  struct PollEvent
  {
    PollState state;
    std::chrono::seconds at;
    ArtifactState artifacts;
  };

  /**
   * @brief Mutable context of one poll run
   */
  struct PollContext
  {
    PollState state{PollState::Waiting};
    std::chrono::seconds elapsed{0};
    ArtifactState artifacts;
    std::optional<ExitStatus> exit_status;
    int terminate_requests{0};
    int heartbeats{0};
    std::vector<PollEvent> trace;
  };

  /**
   * @brief Detects build completion independently of the builder's own exit
   *
   * The builder may hang after its real work is finished. The poller
   * watches two signals that can occur in any order relative to the exit
   * of the builder process: the artifact appearing on disk and the local
   * verification oracle accepting it. Once the oracle accepts the artifact
   * the builder is terminated and polling stops.
   *
   * State machine:
   * @code
   * Waiting --artifact exists--> ArtifactSeen --oracle accepts--> Notarized --terminate--> Done
   *    |                             |
   *    +--process exited-------------+--> ProcessExited
   *    +--deadline reached-----------+--> TimedOut
   * @endcode
   *
   * Reaching the deadline does not kill the builder. Unless
   * PollSettings::ignore_stale_outputs is cleared, outputs left behind by an
   * earlier run are not observed until the builder rewrites them.
   */
  class DualConditionPoller
  {
  public:
    DualConditionPoller(PollSettings settings,
                        std::shared_ptr<BuildSupervisor> supervisor,
                        std::shared_ptr<ArtifactProbe> probe,
                        std::shared_ptr<VerificationOracle> oracle,
                        std::shared_ptr<Sleeper> sleeper,
                        bool watch_artifact = true);
    ~DualConditionPoller();

    DualConditionPoller(const DualConditionPoller &) = delete;
    DualConditionPoller &operator=(const DualConditionPoller &) = delete;
    DualConditionPoller(DualConditionPoller &&) noexcept;
    DualConditionPoller &operator=(DualConditionPoller &&) noexcept;

    /**
     * @brief Polls until a terminal state is reached
     *
     * @return PollContext The terminal state (Done, ProcessExited or
     *         TimedOut), the artifact flags and the trace of transitions
     */
    PollContext run(const BuildHandle &handle);

    /**
     * @brief Evaluates the transition rules once, without sleeping
     */
    void tick(PollContext &context, const BuildHandle &handle);

    static bool can_transition(PollState from, PollState to);

  private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
  };

  /**
   * @brief Post-build checks of the expected outputs
   *
   * Runs whatever terminal state the poller reached. A non-zero exit of the
   * builder is not checked here: outputs that exist are accepted.
   */
  class BuildOutputValidator
  {
  public:
    BuildOutputValidator(std::shared_ptr<ArtifactProbe> probe, bool reject_stale_artifacts);

    /**
     * @return PipelineError::BuildArtifactMissing if the bundle is absent,
     *         is not a valid bundle, or its Info.plist is older than the
     *         start of the build when stale outputs are rejected
     */
    outcome::std_result<void> validate_bundle(const BuildTask &task) const;

    /**
     * @return PipelineError::BuildArtifactMissing if the artifact is absent,
     *         or older than the start of the build when stale artifacts are
     *         rejected
     */
    outcome::std_result<void> validate_artifact(const BuildTask &task) const;

    outcome::std_result<void> validate(const BuildTask &task) const;

  private:
    std::shared_ptr<ArtifactProbe> probe_;
    bool reject_stale_artifacts_;
  };

} // namespace relpack

#endif // RELPACK_DUAL_CONDITION_POLLER_HH
