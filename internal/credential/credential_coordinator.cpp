#include "credential_coordinator.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace swarm::credential {

using namespace swarm::observability;

CredentialCoordinator::CredentialCoordinator(IdentityProviderPtr provider, std::string profile,
                                             std::chrono::milliseconds refresh_skew, NowFn now)
    : provider_(std::move(provider)), profile_(std::move(profile)), refresh_skew_(refresh_skew), now_(std::move(now)) {
  if (!provider_) {
    throw std::invalid_argument("CredentialCoordinator: identity provider is required");
  }
}

bool CredentialCoordinator::UsableLocked() const {
  return have_credential_ && !stale_ && current_.Valid(now_(), refresh_skew_);
}

Credential CredentialCoordinator::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return !refreshing_; });

  if (failure_) {
    throw util::AuthRefreshError(*failure_);
  }
  if (UsableLocked()) {
    return current_;
  }
  return RefreshLocked(lock, epoch_);
}

Credential CredentialCoordinator::Refresh() {
  std::unique_lock lock(mutex_);
  return RefreshLocked(lock, epoch_);
}

void CredentialCoordinator::Invalidate(uint64_t epoch) {
  std::lock_guard lock(mutex_);
  if (have_credential_ && epoch == epoch_ && !stale_) {
    stale_ = true;
    SWARM_LOG_INFO("Credential rejected by object store", {IntField("epoch", static_cast<int64_t>(epoch))});
  }
}

Credential CredentialCoordinator::RefreshLocked(std::unique_lock<std::mutex>& lock, uint64_t observed_epoch) {
  cv_.wait(lock, [&] { return !refreshing_; });

  if (failure_) {
    throw util::AuthRefreshError(*failure_);
  }
  // Someone else refreshed while we waited.
  if (epoch_ > observed_epoch && UsableLocked()) {
    return current_;
  }

  refreshing_      = true;
  const bool first = !have_credential_;
  lock.unlock();

  Credential                 fresh;
  std::optional<std::string> error;
  try {
    fresh = first ? provider_->Authenticate(profile_) : provider_->Renew(profile_);
  } catch (const std::exception& e) {
    error = e.what();
  }

  lock.lock();
  refreshing_ = false;

  if (!error && !fresh.Valid(now_(), refresh_skew_)) {
    error = "identity provider returned an expired credential";
  }

  if (error) {
    failure_ = "credential refresh failed for profile '" + profile_ + "': " + *error;
    cv_.notify_all();
    Metrics::Instance().RecordCredentialRefresh(false);
    SWARM_LOG_ERROR("Credential refresh failed", {StringField("profile", profile_), StringField("error", *error)});
    throw util::AuthRefreshError(*failure_);
  }

  ++refreshes_;

  // Keep a longer-lived credential over an older one unless the store has
  // rejected it.
  if (have_credential_ && !stale_ && current_.Valid(now_(), refresh_skew_) && fresh.expires_at < current_.expires_at) {
    SWARM_LOG_DEBUG("Renewal returned an older credential; keeping current", {IntField("epoch", static_cast<int64_t>(epoch_))});
  } else {
    fresh.epoch      = ++epoch_;
    current_         = std::move(fresh);
    have_credential_ = true;
    stale_           = false;
  }

  cv_.notify_all();
  Metrics::Instance().RecordCredentialRefresh(true);
  SWARM_LOG_INFO(first ? "Authenticated" : "Credential renewed",
                 {StringField("profile", profile_), IntField("epoch", static_cast<int64_t>(epoch_))});
  return current_;
}

bool CredentialCoordinator::Failed() const {
  std::lock_guard lock(mutex_);
  return failure_.has_value();
}

uint64_t CredentialCoordinator::epoch() const {
  std::lock_guard lock(mutex_);
  return epoch_;
}

uint64_t CredentialCoordinator::refresh_count() const {
  std::lock_guard lock(mutex_);
  return refreshes_;
}

} // namespace swarm::credential
