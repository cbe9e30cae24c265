#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "credential.hpp"
#include "identity_provider.hpp"

namespace swarm::credential {

/*
  Owns the single credential shared by every worker.

  At most one refresh is in flight at any moment. Callers that arrive while
  a refresh runs block until it finishes and then all observe its result.
  A failed refresh is fatal: the coordinator stays failed and every later
  Acquire/Refresh rethrows util::AuthRefreshError.
*/
class CredentialCoordinator {
 public:
  using NowFn = std::function<util::TimePoint()>;

  CredentialCoordinator(IdentityProviderPtr provider, std::string profile,
                        std::chrono::milliseconds refresh_skew = std::chrono::milliseconds::zero(), NowFn now = util::Now);

  CredentialCoordinator(const CredentialCoordinator&)            = delete;
  CredentialCoordinator& operator=(const CredentialCoordinator&) = delete;

  // Returns a valid credential, authenticating or renewing first if needed.
  Credential Acquire();

  // Forces a renewal unless another caller already refreshed past the epoch
  // observed on entry.
  Credential Refresh();

  // Marks the credential of `epoch` as rejected by the store. No effect if a
  // newer credential is already in place.
  void Invalidate(uint64_t epoch);

  bool Failed() const;

  uint64_t epoch() const;

  // Successful upstream authenticate/renew calls.
  uint64_t refresh_count() const;

 private:
  Credential RefreshLocked(std::unique_lock<std::mutex>& lock, uint64_t observed_epoch);
  bool       UsableLocked() const;

  IdentityProviderPtr       provider_;
  std::string               profile_;
  std::chrono::milliseconds refresh_skew_;
  NowFn                     now_;

  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  Credential                 current_;
  bool                       have_credential_ = false;
  bool                       stale_           = false;
  bool                       refreshing_      = false;
  std::optional<std::string> failure_;
  uint64_t                   epoch_     = 0;
  uint64_t                   refreshes_ = 0;
};

} // namespace swarm::credential
