#pragma once

#include <string>

#include "identity_provider.hpp"

namespace swarm::credential {

/*
  Identity provider backed by external commands, e.g. the AWS CLI:

    authenticate: aws configure export-credentials --profile {profile} --format process
    renew:        aws sso login --profile {profile}

  The authenticate command must print a credential_process JSON document.
  Renew() first authenticates again and runs the login command only when
  that fails or yields expired credentials; the login runs attached to the
  terminal. "{profile}" in either command is replaced by the profile name.
*/
class ProcessIdentityProvider final : public IdentityProvider {
 public:
  ProcessIdentityProvider(std::string authenticate_command, std::string renew_command);

  Credential Authenticate(const std::string& profile) override;
  Credential Renew(const std::string& profile) override;

  // Exposed for tests.
  static Credential ParseProcessCredentials(const std::string& json);

 private:
  std::string authenticate_command_;
  std::string renew_command_;
};

} // namespace swarm::credential
