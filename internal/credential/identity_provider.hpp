#pragma once

#include <memory>
#include <string>

#include "credential.hpp"

namespace swarm::credential {

/*
  Upstream identity provider. Both calls throw util::AuthRefreshError when
  the provider rejects the request (expired session, revoked grant). The
  returned credential's epoch is assigned by the coordinator.
*/
class IdentityProvider {
 public:
  virtual ~IdentityProvider() = default;

  virtual Credential Authenticate(const std::string& profile) = 0;
  virtual Credential Renew(const std::string& profile)        = 0;
};

using IdentityProviderPtr = std::shared_ptr<IdentityProvider>;

} // namespace swarm::credential
