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

#ifndef RELPACK_NOTARIZATION_HH
#define RELPACK_NOTARIZATION_HH

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "relpack/Config.hh"
#include "relpack/Credentials.hh"
#include "relpack/Sleeper.hh"
#include "relpack/Verification.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  class ToolRunner;

  /**
   * @brief Verdict returned by the notarization service
   *
   * Consumed by the stapling step and discarded afterwards.
   */
  struct NotarizationReceipt
  {
    std::string submission_id;
    std::string status;
    bool accepted = false;
  };

  /**
   * @brief Submits an artifact to the remote notarization service
   */
  class NotaryClient
  {
  public:
    virtual ~NotaryClient() = default;

    /**
     * @brief Submits the artifact and blocks until the verdict is available
     *
     * @return outcome::std_result<NotarizationReceipt> The verdict. The
     *         receipt is only returned when the service exited successfully;
     *         a non-zero exit yields PipelineError::NotarizationRejected.
     */
    virtual outcome::std_result<NotarizationReceipt> submit(const std::filesystem::path &artifact, const CredentialSet &credentials) = 0;

    // xcrun notarytool submit <artifact> ... --wait --output-format json
    static std::shared_ptr<NotaryClient> notarytool(std::shared_ptr<ToolRunner> runner, std::string xcrun_tool, std::string acceptance_marker);
  };

  /**
   * @brief Attaches an issued verdict to an artifact
   */
  class Stapler
  {
  public:
    virtual ~Stapler() = default;

    /**
     * @return outcome::std_result<void> Failure is usually transient: the
     *         verdict may not have propagated yet.
     */
    virtual outcome::std_result<void> staple(const std::filesystem::path &artifact) = 0;

    // xcrun stapler staple <artifact>
    static std::shared_ptr<Stapler> xcrun(std::shared_ptr<ToolRunner> runner, std::string xcrun_tool);
  };

  /**
   * @brief Extracts a verdict from notary service output
   *
   * JSON output is read from its "status" and "id" members. Any other
   * output is scanned for the acceptance marker.
   */
  NotarizationReceipt parse_notary_verdict(const std::string &output, const std::string &acceptance_marker);

  struct NotarizationReport
  {
    bool already_notarized = false;
    bool submitted = false;
    bool stapled = false;
    int staple_attempts = 0;
    std::string submission_id;
    std::vector<std::error_code> warnings;
  };

  /**
   * @brief Out-of-band notarization followed by retried stapling
   *
   * Artifacts that the oracle already accepts are not submitted again. A
   * rejection is fatal and not retried. Stapling is retried with a fixed
   * backoff after an initial grace period; running out of attempts is only
   * a warning since the artifact can still be verified online.
   */
  class NotarizationStage
  {
  public:
    NotarizationStage(NotarizationSettings settings,
                      std::shared_ptr<VerificationOracle> oracle,
                      std::shared_ptr<NotaryClient> notary,
                      std::shared_ptr<Stapler> stapler,
                      std::shared_ptr<Sleeper> sleeper);
    ~NotarizationStage();

    NotarizationStage(const NotarizationStage &) = delete;
    NotarizationStage &operator=(const NotarizationStage &) = delete;
    NotarizationStage(NotarizationStage &&) noexcept;
    NotarizationStage &operator=(NotarizationStage &&) noexcept;

    outcome::std_result<NotarizationReport> run(const std::filesystem::path &artifact, const CredentialSet &credentials);

  private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
  };

} // namespace relpack

#endif // RELPACK_NOTARIZATION_HH
