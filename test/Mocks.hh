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

#ifndef RELPACK_TEST_MOCKS_HH
#define RELPACK_TEST_MOCKS_HH

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <gmock/gmock.h>

#include "relpack/ArtifactProbe.hh"
#include "relpack/BuildSupervisor.hh"
#include "relpack/Credentials.hh"
#include "relpack/DiskImage.hh"
#include "relpack/Errors.hh"
#include "relpack/Notarization.hh"
#include "relpack/Sleeper.hh"
#include "relpack/ToolRunner.hh"
#include "relpack/Verification.hh"

namespace outcome = boost::outcome_v2;

namespace relpack::test
{
  inline outcome::std_result<void> ok()
  {
    return outcome::success();
  }

  inline outcome::std_result<void> fail(PipelineError error)
  {
    return error;
  }

  class MockToolRunner : public ToolRunner
  {
  public:
    MOCK_METHOD(outcome::std_result<CommandOutput>, run, (const Command &command), (override));
  };

  class MockBuildSupervisor : public BuildSupervisor
  {
  public:
    MOCK_METHOD(outcome::std_result<BuildHandle>, launch, (const CredentialSet &credentials), (override));
    MOCK_METHOD(bool, is_alive, (const BuildHandle &handle), (override));
    MOCK_METHOD(outcome::std_result<void>, terminate, (const BuildHandle &handle), (override));
    MOCK_METHOD(ExitStatus, join, (const BuildHandle &handle), (override));
  };

  class MockArtifactProbe : public ArtifactProbe
  {
  public:
    MOCK_METHOD(bool, artifact_exists, (const std::filesystem::path &path), (override));
    MOCK_METHOD(bool, bundle_exists, (const std::filesystem::path &path), (override));
    MOCK_METHOD(std::optional<std::filesystem::file_time_type>, modification_time, (const std::filesystem::path &path), (override));
  };

  class MockVerificationOracle : public VerificationOracle
  {
  public:
    MOCK_METHOD(bool, accepts, (const std::filesystem::path &artifact), (override));
  };

  class MockSignatureVerifier : public SignatureVerifier
  {
  public:
    MOCK_METHOD(bool, verify, (const std::filesystem::path &artifact), (override));
  };

  class MockNotaryClient : public NotaryClient
  {
  public:
    MOCK_METHOD(outcome::std_result<NotarizationReceipt>,
                submit,
                (const std::filesystem::path &artifact, const CredentialSet &credentials),
                (override));
  };

  class MockStapler : public Stapler
  {
  public:
    MOCK_METHOD(outcome::std_result<void>, staple, (const std::filesystem::path &artifact), (override));
  };

  class MockDiskImageCreator : public DiskImageCreator
  {
  public:
    MOCK_METHOD(outcome::std_result<void>,
                create,
                (const std::filesystem::path &bundle,
                 const std::filesystem::path &disk_image,
                 const std::string &volume_name,
                 const std::string &signing_identity),
                (override));
  };

  class MockIdentityProbe : public IdentityProbe
  {
  public:
    MOCK_METHOD(std::optional<std::string>, discover, (const std::string &identity_class), (override));
  };

  // Advances a virtual clock instead of sleeping.
  class FakeSleeper : public Sleeper
  {
  public:
    void sleep_for(std::chrono::milliseconds duration) override
    {
      now_ += duration;
      sleeps_.push_back(duration);
    }

    std::chrono::milliseconds now() const
    {
      return now_;
    }

    const std::vector<std::chrono::milliseconds> &sleeps() const
    {
      return sleeps_;
    }

  private:
    std::chrono::milliseconds now_{0};
    std::vector<std::chrono::milliseconds> sleeps_;
  };

  class FakeEnvironment : public Environment
  {
  public:
    FakeEnvironment() = default;
    explicit FakeEnvironment(std::map<std::string, std::string> values)
      : values_(std::move(values))
    {
    }

    std::optional<std::string> get(const std::string &name) const override
    {
      auto it = values_.find(name);
      if (it == values_.end())
        {
          return std::nullopt;
        }
      return it->second;
    }

    void set(const std::string &name, const std::string &value)
    {
      values_[name] = value;
    }

  private:
    std::map<std::string, std::string> values_;
  };

  inline CredentialSet sample_credentials()
  {
    return CredentialSet{"Developer ID Application: Example Corp (TEAMID1234)", "dev@example.com", "abcd-efgh-ijkl-mnop", "TEAMID1234"};
  }

  inline std::map<std::string, std::string> sample_environment()
  {
    return sample_credentials().as_environment();
  }

} // namespace relpack::test

#endif // RELPACK_TEST_MOCKS_HH
