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

#ifndef RELPACK_RELEASE_PIPELINE_HH
#define RELPACK_RELEASE_PIPELINE_HH

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "relpack/ArtifactProbe.hh"
#include "relpack/BuildSupervisor.hh"
#include "relpack/Config.hh"
#include "relpack/Credentials.hh"
#include "relpack/DiskImage.hh"
#include "relpack/DualConditionPoller.hh"
#include "relpack/Notarization.hh"
#include "relpack/Publisher.hh"
#include "relpack/Sleeper.hh"
#include "relpack/Verification.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  /**
   * @brief External collaborators used by the pipeline
   */
  struct Collaborators
  {
    std::shared_ptr<Environment> environment;
    std::shared_ptr<IdentityProbe> identity_probe;
    std::shared_ptr<BuildSupervisor> supervisor;
    std::shared_ptr<ArtifactProbe> probe;
    std::shared_ptr<VerificationOracle> oracle;
    std::shared_ptr<SignatureVerifier> signature_verifier;
    std::shared_ptr<NotaryClient> notary;
    std::shared_ptr<Stapler> stapler;
    std::shared_ptr<DiskImageCreator> disk_image_creator;
    std::shared_ptr<Sleeper> sleeper;

    /**
     * @brief Collaborators backed by the real macOS tools
     */
    static Collaborators system(const PipelineConfig &config);
  };

  struct RunReport
  {
    std::vector<CredentialField> missing_credentials;
    std::optional<PollContext> poll;
    std::optional<NotarizationReport> notarization;
    std::optional<PublishResult> publish;
    std::vector<std::error_code> warnings;
  };

  /**
   * @brief Build, notarize, verify and publish a release
   *
   * Stages run strictly in order: credential resolution, supervised build
   * with dual-condition polling, optional disk image creation, output
   * validation, notarization and stapling, verification and publication.
   * The first fatal error stops the run; warnings are collected in the
   * RunReport.
   *
   * @par Example Usage
   * @code
   * relpack::ReleasePipeline pipeline(config, relpack::Collaborators::system(config));
   * auto result = pipeline.run();
   * if (!result) {
   *     std::cerr << relpack::remediation_for(result.error(), config);
   * }
   * @endcode
   */
  class ReleasePipeline
  {
  public:
    ReleasePipeline(PipelineConfig config, Collaborators collaborators);
    ~ReleasePipeline();

    ReleasePipeline(const ReleasePipeline &) = delete;
    ReleasePipeline &operator=(const ReleasePipeline &) = delete;
    ReleasePipeline(ReleasePipeline &&) noexcept;
    ReleasePipeline &operator=(ReleasePipeline &&) noexcept;

    outcome::std_result<PublishResult> run();

    const RunReport &report() const;

  private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
  };

  /**
   * @brief Manual remediation hint for a fatal pipeline error
   */
  std::string remediation_for(const std::error_code &error, const PipelineConfig &config);

} // namespace relpack

#endif // RELPACK_RELEASE_PIPELINE_HH
