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

#include "relpack/Publisher.hh"

#include <array>
#include <chrono>
#include <fstream>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "Policy.hh"
#include "relpack/Errors.hh"

namespace relpack
{
  namespace
  {
    constexpr int COPY_ATTEMPTS = 3;
    constexpr std::chrono::milliseconds COPY_RETRY_DELAY{200};

    outcome::std_result<std::string> sha256_of(const std::filesystem::path &path)
    {
      std::ifstream file(path, std::ios::in | std::ios::binary);
      if (!file.is_open())
        {
          return PipelineError::PublishFailed;
        }

      std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
      if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        {
          return PipelineError::SystemError;
        }

      std::array<char, 1 << 16> buffer{};
      while (file)
        {
          file.read(buffer.data(), buffer.size());
          const auto count = file.gcount();
          if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1)
            {
              return PipelineError::SystemError;
            }
        }
      if (file.bad())
        {
          return PipelineError::PublishFailed;
        }

      std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
      unsigned int digest_length = 0;
      if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1)
        {
          return PipelineError::SystemError;
        }

      std::string hex;
      hex.reserve(digest_length * 2);
      for (unsigned int i = 0; i < digest_length; ++i)
        {
          hex += fmt::format("{:02x}", digest[i]);
        }
      return hex;
    }
  } // namespace

  std::string human_readable_size(std::uintmax_t size_bytes)
  {
    static constexpr std::array<char, 6> units{'K', 'M', 'G', 'T', 'P', 'E'};

    if (size_bytes < 1024)
      {
        return fmt::format("{}B", size_bytes);
      }

    double value = static_cast<double>(size_bytes);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < units.size())
      {
        value /= 1024.0;
        ++unit;
      }

    if (value < 10.0)
      {
        return fmt::format("{:.1f}{}", value, units[unit]);
      }
    return fmt::format("{:.0f}{}", value, units[unit]);
  }

  class PublishStage::Impl
  {
  public:
    Impl(std::shared_ptr<SignatureVerifier> signature_verifier, std::shared_ptr<VerificationOracle> oracle, std::shared_ptr<Sleeper> sleeper)
      : signature_verifier_(std::move(signature_verifier))
      , oracle_(std::move(oracle))
      , sleeper_(std::move(sleeper))
    {
    }

    outcome::std_result<PublishResult> run(const std::filesystem::path &artifact,
                                           const std::filesystem::path &publish_directory,
                                           std::vector<std::error_code> &warnings)
    {
      logger_->info("Verifying code signature of {}", artifact.filename().string());
      if (!signature_verifier_->verify(artifact))
        {
          logger_->error("Code signature verification failed; nothing is published");
          return PipelineError::SignatureInvalid;
        }

      logger_->info("Verifying notarization of {}", artifact.filename().string());
      outcome::std_result<void> notarized = outcome::success();
      if (!oracle_->accepts(artifact))
        {
          notarized = PipelineError::NotarizationUnverified;
        }
      auto verified = degrade(notarized, warnings, *logger_, "Notarization check");
      if (!verified)
        {
          return verified.error();
        }

      std::error_code ec;
      std::filesystem::create_directories(publish_directory, ec);
      if (ec)
        {
          logger_->error("Cannot create publish directory {}: {}", publish_directory.string(), ec.message());
          return PipelineError::PublishFailed;
        }

      PublishResult result;
      result.source_path = artifact;
      result.destination_path = publish_directory / artifact.filename();

      auto copied = copy(artifact, result.destination_path);
      if (!copied)
        {
          return copied.error();
        }

      result.size_bytes = std::filesystem::file_size(result.destination_path, ec);
      if (ec)
        {
          logger_->error("Cannot determine size of {}: {}", result.destination_path.string(), ec.message());
          return PipelineError::PublishFailed;
        }

      auto digest = sha256_of(result.destination_path);
      if (!digest)
        {
          logger_->error("Cannot compute SHA-256 of {}: {}", result.destination_path.string(), digest.error().message());
          return PipelineError::PublishFailed;
        }
      result.sha256 = digest.value();

      logger_->info("Published {} ({}, sha256 {})", result.destination_path.string(), human_readable_size(result.size_bytes), result.sha256);
      return result;
    }

  private:
    outcome::std_result<void> copy(const std::filesystem::path &from, const std::filesystem::path &to)
    {
      std::error_code ec;
      for (int attempt = 1; attempt <= COPY_ATTEMPTS; ++attempt)
        {
          ec.clear();
          std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
          if (!ec)
            {
              return outcome::success();
            }

          logger_->warn("Copy of {} to {} failed (attempt {}/{}): {}", from.string(), to.string(), attempt, COPY_ATTEMPTS, ec.message());
          if (attempt < COPY_ATTEMPTS)
            {
              sleeper_->sleep_for(COPY_RETRY_DELAY);
            }
        }
      return PipelineError::PublishFailed;
    }

    std::shared_ptr<SignatureVerifier> signature_verifier_;
    std::shared_ptr<VerificationOracle> oracle_;
    std::shared_ptr<Sleeper> sleeper_;
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:publish")};
  };

  PublishStage::PublishStage(std::shared_ptr<SignatureVerifier> signature_verifier,
                             std::shared_ptr<VerificationOracle> oracle,
                             std::shared_ptr<Sleeper> sleeper)
    : pimpl(std::make_unique<Impl>(std::move(signature_verifier), std::move(oracle), std::move(sleeper)))
  {
  }

  PublishStage::~PublishStage() = default;
  PublishStage::PublishStage(PublishStage &&) noexcept = default;
  PublishStage &PublishStage::operator=(PublishStage &&) noexcept = default;

  outcome::std_result<PublishResult> PublishStage::run(const std::filesystem::path &artifact,
                                                       const std::filesystem::path &publish_directory,
                                                       std::vector<std::error_code> &warnings)
  {
    return pimpl->run(artifact, publish_directory, warnings);
  }

} // namespace relpack
