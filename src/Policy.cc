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

#include "Policy.hh"

#include "relpack/Errors.hh"

namespace relpack
{
  Severity severity_of(const std::error_code &error)
  {
    if (error == PipelineError::StapleExhausted || error == PipelineError::NotarizationUnverified)
      {
        return Severity::Warning;
      }
    if (error == PipelineError::TerminationFailed)
      {
        return Severity::Expected;
      }
    return Severity::Fatal;
  }

  outcome::std_result<void> degrade(outcome::std_result<void> result,
                                    std::vector<std::error_code> &warnings,
                                    spdlog::logger &logger,
                                    std::string_view what)
  {
    if (result)
      {
        return outcome::success();
      }

    const auto &error = result.error();
    switch (severity_of(error))
      {
      case Severity::Warning:
        logger.warn("{}: {} (continuing)", what, error.message());
        warnings.push_back(error);
        return outcome::success();

      case Severity::Expected:
        logger.debug("{}: {} (ignored)", what, error.message());
        return outcome::success();

      case Severity::Fatal:
        break;
      }

    logger.error("{}: {}", what, error.message());
    return error;
  }

} // namespace relpack
