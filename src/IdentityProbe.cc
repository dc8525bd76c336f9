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

#include "IdentityProbe.hh"

#include <sstream>

#include "relpack/ToolRunner.hh"

namespace relpack
{
  std::optional<std::string> parse_identity_listing(const std::string &listing, const std::string &identity_class)
  {
    std::istringstream stream(listing);
    std::string line;
    while (std::getline(stream, line))
      {
        if (line.find(identity_class) == std::string::npos)
          {
            continue;
          }

        auto open = line.find('"');
        auto close = line.rfind('"');
        if (open == std::string::npos || close == open)
          {
            continue;
          }
        return line.substr(open + 1, close - open - 1);
      }
    return std::nullopt;
  }

  SecurityIdentityProbe::SecurityIdentityProbe(std::shared_ptr<ToolRunner> runner, std::string security_tool)
    : runner_(std::move(runner))
    , security_tool_(std::move(security_tool))
  {
  }

  std::optional<std::string> SecurityIdentityProbe::discover(const std::string &identity_class)
  {
    Command command{security_tool_, {"find-identity", "-v", "-p", "codesigning"}};

    auto result = runner_->run(command);
    if (!result)
      {
        logger_->warn("Cannot list signing identities: {}", result.error().message());
        return std::nullopt;
      }

    if (!result.value().succeeded())
      {
        logger_->warn("{} exited with code {} while listing signing identities", security_tool_, result.value().exit_code);
        return std::nullopt;
      }

    auto identity = parse_identity_listing(result.value().output, identity_class);
    if (!identity)
      {
        logger_->debug("No '{}' identity installed", identity_class);
      }
    return identity;
  }

  std::shared_ptr<IdentityProbe> IdentityProbe::security(std::shared_ptr<ToolRunner> runner, std::string security_tool)
  {
    return std::make_shared<SecurityIdentityProbe>(std::move(runner), std::move(security_tool));
  }

} // namespace relpack
