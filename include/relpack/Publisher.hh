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

#ifndef RELPACK_PUBLISHER_HH
#define RELPACK_PUBLISHER_HH

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "relpack/Sleeper.hh"
#include "relpack/Verification.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  struct PublishResult
  {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::uintmax_t size_bytes = 0;
    std::string sha256;
  };

  /**
   * @brief Formats a byte count the way `du -h` does, e.g. "12.4M"
   */
  std::string human_readable_size(std::uintmax_t size_bytes);

  /**
   * @brief Final verification of the artifact followed by its publication
   *
   * The artifact itself is never modified; the only write is the copy into
   * the publish directory.
   */
  class PublishStage
  {
  public:
    PublishStage(std::shared_ptr<SignatureVerifier> signature_verifier,
                 std::shared_ptr<VerificationOracle> oracle,
                 std::shared_ptr<Sleeper> sleeper);
    ~PublishStage();

    PublishStage(const PublishStage &) = delete;
    PublishStage &operator=(const PublishStage &) = delete;
    PublishStage(PublishStage &&) noexcept;
    PublishStage &operator=(PublishStage &&) noexcept;

    /**
     * @brief Verifies the artifact and copies it into publish_directory
     *
     * @param artifact The artifact to publish
     * @param publish_directory Destination directory, created if absent
     * @param warnings Receives PipelineError::NotarizationUnverified when the
     *        oracle rejects the artifact
     *
     * @return outcome::std_result<PublishResult> The published file,
     *         PipelineError::SignatureInvalid when the code signature does
     *         not verify (nothing is published), PipelineError::PublishFailed
     *         when the copy fails
     */
    outcome::std_result<PublishResult> run(const std::filesystem::path &artifact,
                                           const std::filesystem::path &publish_directory,
                                           std::vector<std::error_code> &warnings);

  private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
  };

} // namespace relpack

#endif // RELPACK_PUBLISHER_HH
