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

#ifndef RELPACK_POLICY_HH
#define RELPACK_POLICY_HH

#include <string_view>
#include <system_error>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

namespace outcome = boost::outcome_v2;

namespace relpack
{
  enum class Severity
  {
    Fatal,
    Warning,
    Expected,
  };

  /**
   * @brief How a pipeline error affects the run
   *
   * Warning: logged and recorded, the run continues.
   * Expected: failure of a best-effort action that is known to fail
   * harmlessly (terminating a process that already exited).
   * Fatal: the run stops.
   */
  Severity severity_of(const std::error_code &error);

  /**
   * @brief Applies severity_of() to the result of a step
   *
   * Fatal errors are returned unchanged. Warnings are logged and appended
   * to warnings; expected failures are logged at debug level. Both then
   * count as success.
   */
  outcome::std_result<void> degrade(outcome::std_result<void> result,
                                    std::vector<std::error_code> &warnings,
                                    spdlog::logger &logger,
                                    std::string_view what);

} // namespace relpack

#endif // RELPACK_POLICY_HH
