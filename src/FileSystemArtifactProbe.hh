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

#ifndef RELPACK_FILE_SYSTEM_ARTIFACT_PROBE_HH
#define RELPACK_FILE_SYSTEM_ARTIFACT_PROBE_HH

#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/ArtifactProbe.hh"
#include "relpack/Sleeper.hh"

namespace relpack
{
  class FileSystemArtifactProbe : public ArtifactProbe
  {
  public:
    explicit FileSystemArtifactProbe(std::shared_ptr<Sleeper> sleeper, int attempts = 3);
    ~FileSystemArtifactProbe() override = default;

    FileSystemArtifactProbe(const FileSystemArtifactProbe &) = delete;
    FileSystemArtifactProbe &operator=(const FileSystemArtifactProbe &) = delete;
    FileSystemArtifactProbe(FileSystemArtifactProbe &&) = delete;
    FileSystemArtifactProbe &operator=(FileSystemArtifactProbe &&) = delete;

    bool artifact_exists(const std::filesystem::path &path) override;
    bool bundle_exists(const std::filesystem::path &path) override;
    std::optional<std::filesystem::file_time_type> modification_time(const std::filesystem::path &path) override;

  private:
    std::filesystem::file_status status_of(const std::filesystem::path &path);
    static bool is_transient(const std::error_code &ec);

    std::shared_ptr<Sleeper> sleeper_;
    int attempts_;
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:artifact_probe")};
  };

} // namespace relpack

#endif // RELPACK_FILE_SYSTEM_ARTIFACT_PROBE_HH
