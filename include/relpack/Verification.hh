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

#ifndef RELPACK_VERIFICATION_HH
#define RELPACK_VERIFICATION_HH

#include <filesystem>
#include <memory>
#include <string>

namespace relpack
{
  class ToolRunner;

  /**
   * @brief Local trust policy check of an artifact
   *
   * Answers whether the local trust policy currently accepts the artifact.
   * Besides being the final notarization gate, acceptance is the only
   * observable sign that a remote notarization verdict has propagated.
   * Any failure to obtain an answer is reported as "not accepted".
   */
  class VerificationOracle
  {
  public:
    virtual ~VerificationOracle() = default;

    virtual bool accepts(const std::filesystem::path &artifact) = 0;

    // spctl -a -t open --context context:primary-signature <artifact>
    static std::shared_ptr<VerificationOracle> spctl(std::shared_ptr<ToolRunner> runner, std::string spctl_tool);
  };

  /**
   * @brief Code signature check of an artifact
   */
  class SignatureVerifier
  {
  public:
    virtual ~SignatureVerifier() = default;

    virtual bool verify(const std::filesystem::path &artifact) = 0;

    // codesign -v <artifact>
    static std::shared_ptr<SignatureVerifier> codesign(std::shared_ptr<ToolRunner> runner, std::string codesign_tool);
  };

} // namespace relpack

#endif // RELPACK_VERIFICATION_HH
