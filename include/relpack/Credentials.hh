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

#ifndef RELPACK_CREDENTIALS_HH
#define RELPACK_CREDENTIALS_HH

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace relpack
{
  class ToolRunner;

  enum class CredentialField
  {
    SigningIdentity,
    AccountId,
    AccountSecret,
    OrganizationId,
  };

  /**
   * @brief Name of the environment variable that carries a credential field
   */
  const char *variable_name(CredentialField field);

  /**
   * @brief The four secrets required to sign and notarize a release
   *
   * Once returned by CredentialResolver::resolve() all fields are non-empty.
   * Values must never be logged verbatim; use masked_identity() and the
   * presence flags instead.
   */
  struct CredentialSet
  {
    std::string signing_identity;
    std::string account_id;
    std::string account_secret;
    std::string organization_id;

    const std::string &get(CredentialField field) const;
    std::string &get(CredentialField field);

    std::vector<CredentialField> missing_fields() const;
    std::string masked_identity() const;

    /**
     * @brief The credentials as process environment entries
     *
     * Maps each variable name (APPLE_SIGNING_IDENTITY, APPLE_ID,
     * APPLE_PASSWORD, APPLE_TEAM_ID) to its value.
     */
    std::map<std::string, std::string> as_environment() const;

    /**
     * @brief Values that must be redacted from any logged command line
     */
    std::vector<std::string> secrets() const;
  };

  /**
   * @brief Read-only view of process environment variables
   */
  class Environment
  {
  public:
    virtual ~Environment() = default;

    virtual std::optional<std::string> get(const std::string &name) const = 0;

    static std::shared_ptr<Environment> process();
  };

  /**
   * @brief Discovers a locally installed code signing identity
   */
  class IdentityProbe
  {
  public:
    virtual ~IdentityProbe() = default;

    /**
     * @brief Returns the first installed identity whose name contains identity_class
     *
     * @param identity_class Certificate class, e.g. "Developer ID Application"
     * @return std::optional<std::string> The full identity name, or nullopt
     *         when none is installed or the keychain cannot be queried
     */
    virtual std::optional<std::string> discover(const std::string &identity_class) = 0;

    static std::shared_ptr<IdentityProbe> security(std::shared_ptr<ToolRunner> runner, std::string security_tool);
  };

  /**
   * @brief Resolves the CredentialSet from layered sources
   *
   * Sources, in order of precedence:
   * - the process environment (values already set are never overridden)
   * - an optional env file of KEY=VALUE lines
   * - for the signing identity only, discovery through an IdentityProbe
   *
   * @par Example
   * @code
   * relpack::CredentialResolver resolver(relpack::Environment::process(), "../.env.local", probe);
   * auto credentials = resolver.resolve();
   * if (!credentials) {
   *     for (auto field : resolver.missing()) { ... }
   * }
   * @endcode
   */
  class CredentialResolver
  {
  public:
    CredentialResolver(std::shared_ptr<Environment> environment,
                       std::optional<std::filesystem::path> env_file,
                       std::shared_ptr<IdentityProbe> identity_probe,
                       std::string identity_class = "Developer ID Application");
    ~CredentialResolver();

    CredentialResolver(const CredentialResolver &) = delete;
    CredentialResolver &operator=(const CredentialResolver &) = delete;
    CredentialResolver(CredentialResolver &&) noexcept;
    CredentialResolver &operator=(CredentialResolver &&) noexcept;

    /**
     * @brief Produces a fully populated CredentialSet
     *
     * @return outcome::std_result<CredentialSet> The credentials, or
     *         PipelineError::MissingCredential when any field stays empty.
     *         The absent fields are then available from missing().
     */
    outcome::std_result<CredentialSet> resolve();

    /**
     * @brief Fields found absent by the last call to resolve()
     */
    const std::vector<CredentialField> &missing() const;

  private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
  };

} // namespace relpack

#endif // RELPACK_CREDENTIALS_HH
