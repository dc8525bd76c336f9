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

#ifndef RELPACK_ARTIFACT_PROBE_HH
#define RELPACK_ARTIFACT_PROBE_HH

#include <filesystem>
#include <memory>
#include <optional>

#include "relpack/Sleeper.hh"

namespace relpack
{
  /**
   * @brief Observes the build outputs on disk
   *
   * The builder is the only writer of these paths and may still be
   * flushing when they are first observed, so implementations retry
   * transient I/O errors before answering.
   */
  class ArtifactProbe
  {
  public:
    virtual ~ArtifactProbe() = default;

    /**
     * @brief True if path is a regular file
     */
    virtual bool artifact_exists(const std::filesystem::path &path) = 0;

    /**
     * @brief True if path is an application bundle (a directory with Contents/Info.plist)
     */
    virtual bool bundle_exists(const std::filesystem::path &path) = 0;

    virtual std::optional<std::filesystem::file_time_type> modification_time(const std::filesystem::path &path) = 0;

    /**
     * @brief Probe of the local filesystem; transient stat errors are retried
     *        with waits on sleeper
     */
    static std::shared_ptr<ArtifactProbe> filesystem(std::shared_ptr<Sleeper> sleeper = Sleeper::system());
  };

} // namespace relpack

#endif // RELPACK_ARTIFACT_PROBE_HH
