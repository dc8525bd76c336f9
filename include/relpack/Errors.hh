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

#ifndef RELPACK_ERRORS_HH
#define RELPACK_ERRORS_HH

#include <string>
#include <system_error>

namespace relpack
{
  enum class PipelineError
  {
    MissingCredential = 1,
    BuildArtifactMissing,
    NotarizationRejected,
    StapleExhausted,
    SignatureInvalid,
    NotarizationUnverified,
    InvalidConfiguration,
    ToolLaunchFailed,
    DiskImageFailed,
    PublishFailed,
    TerminationFailed,
    SystemError,
  };

  class PipelineErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "relpack";
    }

    std::string message(int ev) const override
    {
      switch (static_cast<PipelineError>(ev))
        {
        case PipelineError::MissingCredential:
          return "Missing credential";
        case PipelineError::BuildArtifactMissing:
          return "Build artifact missing";
        case PipelineError::NotarizationRejected:
          return "Notarization rejected";
        case PipelineError::StapleExhausted:
          return "Stapling retries exhausted";
        case PipelineError::SignatureInvalid:
          return "Code signature invalid";
        case PipelineError::NotarizationUnverified:
          return "Notarization not verified";
        case PipelineError::InvalidConfiguration:
          return "Invalid configuration";
        case PipelineError::ToolLaunchFailed:
          return "Failed to launch external tool";
        case PipelineError::DiskImageFailed:
          return "Disk image creation failed";
        case PipelineError::PublishFailed:
          return "Publish failed";
        case PipelineError::TerminationFailed:
          return "Termination failed";
        case PipelineError::SystemError:
          return "System error";
        default:
          return "Unknown error";
        }
    }
  };

  const std::error_category &pipeline_error_category();
  std::error_code make_error_code(PipelineError e);

} // namespace relpack

namespace std
{
  template<>
  struct is_error_code_enum<relpack::PipelineError> : std::true_type
  {
  };
} // namespace std

#endif // RELPACK_ERRORS_HH
