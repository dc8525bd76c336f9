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

#include "FileSystemArtifactProbe.hh"

#include <cerrno>
#include <chrono>

namespace relpack
{
  namespace
  {
    constexpr std::chrono::milliseconds RETRY_DELAY{100};
  } // namespace

  FileSystemArtifactProbe::FileSystemArtifactProbe(std::shared_ptr<Sleeper> sleeper, int attempts)
    : sleeper_(std::move(sleeper))
    , attempts_(attempts < 1 ? 1 : attempts)
  {
  }

  bool FileSystemArtifactProbe::is_transient(const std::error_code &ec)
  {
    return ec == std::errc::resource_unavailable_try_again || ec == std::errc::interrupted || ec == std::errc::device_or_resource_busy
           || ec == std::errc::io_error;
  }

  std::filesystem::file_status FileSystemArtifactProbe::status_of(const std::filesystem::path &path)
  {
    std::error_code ec;
    for (int attempt = 1;; ++attempt)
      {
        ec.clear();
        auto status = std::filesystem::status(path, ec);
        if (!ec || !is_transient(ec) || attempt >= attempts_)
          {
            if (ec && ec != std::errc::no_such_file_or_directory)
              {
                logger_->debug("Cannot stat {}: {}", path.string(), ec.message());
              }
            return status;
          }

        logger_->debug("Transient error on {} (attempt {}/{}): {}", path.string(), attempt, attempts_, ec.message());
        sleeper_->sleep_for(RETRY_DELAY);
      }
  }

  bool FileSystemArtifactProbe::artifact_exists(const std::filesystem::path &path)
  {
    return std::filesystem::is_regular_file(status_of(path));
  }

  bool FileSystemArtifactProbe::bundle_exists(const std::filesystem::path &path)
  {
    if (!std::filesystem::is_directory(status_of(path)))
      {
        return false;
      }
    return std::filesystem::is_regular_file(status_of(path / "Contents" / "Info.plist"));
  }

  std::optional<std::filesystem::file_time_type> FileSystemArtifactProbe::modification_time(const std::filesystem::path &path)
  {
    if (!artifact_exists(path) && !std::filesystem::is_directory(status_of(path)))
      {
        return std::nullopt;
      }

    std::error_code ec;
    auto time = std::filesystem::last_write_time(path, ec);
    if (ec)
      {
        logger_->warn("Cannot read modification time of {}: {}", path.string(), ec.message());
        return std::nullopt;
      }
    return time;
  }

  std::shared_ptr<ArtifactProbe> ArtifactProbe::filesystem(std::shared_ptr<Sleeper> sleeper)
  {
    return std::make_shared<FileSystemArtifactProbe>(std::move(sleeper));
  }

} // namespace relpack
