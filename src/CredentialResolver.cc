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

#include "relpack/Credentials.hh"

#include <system_error>

#include "EnvFileLoader.hh"
#include "Logging.hh"
#include "relpack/Errors.hh"

namespace relpack
{
  class CredentialResolver::Impl
  {
  public:
    Impl(std::shared_ptr<Environment> environment,
         std::optional<std::filesystem::path> env_file,
         std::shared_ptr<IdentityProbe> identity_probe,
         std::string identity_class)
      : environment_(std::move(environment))
      , env_file_(std::move(env_file))
      , identity_probe_(std::move(identity_probe))
      , identity_class_(std::move(identity_class))
    {
    }

    outcome::std_result<CredentialSet> resolve()
    {
      CredentialSet credentials;

      load_from_environment(credentials);
      load_from_env_file(credentials);
      discover_identity(credentials);

      logger_->info("Checking credentials...");
      missing_ = credentials.missing_fields();
      if (!missing_.empty())
        {
          logger_->error("Missing required environment variables:");
          for (auto field: missing_)
            {
              logger_->error("  - {}", variable_name(field));
            }
          return PipelineError::MissingCredential;
        }

      logger_->info("  APPLE_SIGNING_IDENTITY: {}", credentials.masked_identity());
      logger_->info("  APPLE_TEAM_ID: [set]");
      logger_->info("  APPLE_ID: [set]");
      logger_->info("  APPLE_PASSWORD: [set]");
      return credentials;
    }

    const std::vector<CredentialField> &missing() const
    {
      return missing_;
    }

  private:
    static constexpr CredentialField FIELDS[] = {
      CredentialField::SigningIdentity,
      CredentialField::AccountId,
      CredentialField::AccountSecret,
      CredentialField::OrganizationId,
    };

    void load_from_environment(CredentialSet &credentials)
    {
      for (auto field: FIELDS)
        {
          auto value = environment_->get(variable_name(field));
          if (value && !value->empty())
            {
              credentials.get(field) = *value;
            }
        }
    }

    void load_from_env_file(CredentialSet &credentials)
    {
      if (!env_file_)
        {
          return;
        }

      std::error_code ec;
      if (!std::filesystem::is_regular_file(*env_file_, ec))
        {
          logger_->debug("No credential file at {}", env_file_->string());
          return;
        }

      logger_->info("Loading credentials from {}...", env_file_->string());

      EnvFileLoader loader;
      auto entries = loader.load_from_file(*env_file_);
      if (!entries)
        {
          logger_->warn("Ignoring unreadable credential file {}: {}", env_file_->string(), entries.error().message());
          return;
        }

      for (auto field: FIELDS)
        {
          auto &value = credentials.get(field);
          if (!value.empty())
            {
              continue;
            }

          auto it = entries.value().find(variable_name(field));
          if (it != entries.value().end())
            {
              value = it->second;
            }
        }
    }

    void discover_identity(CredentialSet &credentials)
    {
      if (!credentials.signing_identity.empty() || !identity_probe_)
        {
          return;
        }

      auto identity = identity_probe_->discover(identity_class_);
      if (identity && !identity->empty())
        {
          credentials.signing_identity = *identity;
          logger_->info("Auto-detected signing identity: {}", credentials.masked_identity());
        }
    }

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:credentials")};
    std::shared_ptr<Environment> environment_;
    std::optional<std::filesystem::path> env_file_;
    std::shared_ptr<IdentityProbe> identity_probe_;
    std::string identity_class_;
    std::vector<CredentialField> missing_;
  };

  CredentialResolver::CredentialResolver(std::shared_ptr<Environment> environment,
                                         std::optional<std::filesystem::path> env_file,
                                         std::shared_ptr<IdentityProbe> identity_probe,
                                         std::string identity_class)
    : pimpl(std::make_unique<Impl>(std::move(environment), std::move(env_file), std::move(identity_probe), std::move(identity_class)))
  {
  }

  CredentialResolver::~CredentialResolver() = default;
  CredentialResolver::CredentialResolver(CredentialResolver &&) noexcept = default;
  CredentialResolver &CredentialResolver::operator=(CredentialResolver &&) noexcept = default;

  outcome::std_result<CredentialSet> CredentialResolver::resolve()
  {
    return pimpl->resolve();
  }

  const std::vector<CredentialField> &CredentialResolver::missing() const
  {
    return pimpl->missing();
  }

} // namespace relpack
