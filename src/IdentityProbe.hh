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

#ifndef RELPACK_IDENTITY_PROBE_HH
#define RELPACK_IDENTITY_PROBE_HH

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/Credentials.hh"

namespace relpack
{
  /**
   * @brief Picks the first identity of a class from `security find-identity` output
   *
   * Lines look like:
   * @code
   *   1) 0123ABCD... "Developer ID Application: Example Corp (TEAMID1234)"
   * @endcode
   */
  std::optional<std::string> parse_identity_listing(const std::string &listing, const std::string &identity_class);

  class SecurityIdentityProbe : public IdentityProbe
  {
  public:
    SecurityIdentityProbe(std::shared_ptr<ToolRunner> runner, std::string security_tool);

    std::optional<std::string> discover(const std::string &identity_class) override;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:identity_probe")};
    std::shared_ptr<ToolRunner> runner_;
    std::string security_tool_;
  };

} // namespace relpack

#endif // RELPACK_IDENTITY_PROBE_HH
