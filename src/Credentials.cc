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

namespace relpack
{
  namespace
  {
    constexpr std::size_t MAX_VISIBLE_IDENTITY = 50;

    constexpr CredentialField ALL_FIELDS[] = {
      CredentialField::SigningIdentity,
      CredentialField::OrganizationId,
      CredentialField::AccountId,
      CredentialField::AccountSecret,
    };
  } // namespace

  const char *variable_name(CredentialField field)
  {
    switch (field)
      {
      case CredentialField::SigningIdentity:
        return "APPLE_SIGNING_IDENTITY";
      case CredentialField::AccountId:
        return "APPLE_ID";
      case CredentialField::AccountSecret:
        return "APPLE_PASSWORD";
      case CredentialField::OrganizationId:
        return "APPLE_TEAM_ID";
      }
    return "";
  }

  const std::string &CredentialSet::get(CredentialField field) const
  {
    switch (field)
      {
      case CredentialField::SigningIdentity:
        return signing_identity;
      case CredentialField::AccountId:
        return account_id;
      case CredentialField::AccountSecret:
        return account_secret;
      case CredentialField::OrganizationId:
        break;
      }
    return organization_id;
  }

  std::string &CredentialSet::get(CredentialField field)
  {
    return const_cast<std::string &>(static_cast<const CredentialSet &>(*this).get(field));
  }

  std::vector<CredentialField> CredentialSet::missing_fields() const
  {
    std::vector<CredentialField> missing;
    for (auto field: ALL_FIELDS)
      {
        if (get(field).empty())
          {
            missing.push_back(field);
          }
      }
    return missing;
  }

  std::string CredentialSet::masked_identity() const
  {
    if (signing_identity.size() <= MAX_VISIBLE_IDENTITY)
      {
        return signing_identity;
      }
    return signing_identity.substr(0, MAX_VISIBLE_IDENTITY) + "...";
  }

  std::map<std::string, std::string> CredentialSet::as_environment() const
  {
    std::map<std::string, std::string> environment;
    for (auto field: ALL_FIELDS)
      {
        environment[variable_name(field)] = get(field);
      }
    return environment;
  }

  std::vector<std::string> CredentialSet::secrets() const
  {
    return {account_id, account_secret, organization_id};
  }

} // namespace relpack
