#include "internal/credential/credential_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/credential/process_identity_provider.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using swarm::credential::Credential;
using swarm::credential::CredentialCoordinator;
using swarm::credential::ProcessIdentityProvider;
using swarm::testing::FakeIdentityProvider;
using swarm::testing::TempDir;

template <typename Fn>
bool ThrowsAuthRefresh(Fn&& fn) {
  try {
    fn();
  } catch (const swarm::util::AuthRefreshError&) {
    return true;
  }
  return false;
}

void TestFirstAcquireAuthenticatesOnce() {
  auto                  provider = std::make_shared<FakeIdentityProvider>();
  CredentialCoordinator coordinator(provider, "default");

  const auto first  = coordinator.Acquire();
  const auto second = coordinator.Acquire();

  assert(provider->authenticate_calls() == 1);
  assert(provider->renew_calls() == 0);
  assert(first.epoch == 1);
  assert(second.access_key_id == first.access_key_id);
  assert(coordinator.refresh_count() == 1);
}

void TestExpiredCredentialIsNeverReturned() {
  auto                  provider = std::make_shared<FakeIdentityProvider>(50ms);
  CredentialCoordinator coordinator(provider, "default");

  const auto first = coordinator.Acquire();
  std::this_thread::sleep_for(80ms);

  const auto second = coordinator.Acquire();
  assert(provider->renew_calls() == 1);
  assert(second.epoch == first.epoch + 1);
  assert(second.Valid(swarm::util::Now()));
}

void TestRefreshSkewRenewsEarly() {
  auto                  provider = std::make_shared<FakeIdentityProvider>(10min);
  CredentialCoordinator coordinator(provider, "default", std::chrono::minutes(15));

  // Expires inside the skew window, so it is unusable from the start.
  assert(ThrowsAuthRefresh([&] { (void)coordinator.Acquire(); }));
  assert(coordinator.Failed());
}

void TestConcurrentExpiryRenewsExactlyOnce() {
  auto                  provider = std::make_shared<FakeIdentityProvider>(100ms);
  CredentialCoordinator coordinator(provider, "default");

  (void)coordinator.Acquire();
  std::this_thread::sleep_for(150ms);

  provider->SetLifetime(1h);
  provider->SetRenewDelay(100ms);

  constexpr int            kWorkers = 16;
  std::atomic<int>         ready{0};
  std::atomic<bool>        go{false};
  std::vector<uint64_t>    epochs(kWorkers, 0);
  std::vector<std::thread> threads;
  for (int i = 0; i < kWorkers; ++i) {
    threads.emplace_back([&, i] {
      ++ready;
      while (!go.load()) std::this_thread::yield();
      epochs[i] = coordinator.Acquire().epoch;
    });
  }
  while (ready.load() < kWorkers) std::this_thread::yield();
  go = true;
  for (auto& thread : threads) thread.join();

  assert(provider->renew_calls() == 1);
  for (auto epoch : epochs) assert(epoch == 2);
}

void TestInvalidateOnlyAffectsCurrentEpoch() {
  auto                  provider = std::make_shared<FakeIdentityProvider>();
  CredentialCoordinator coordinator(provider, "default");

  const auto first = coordinator.Acquire();
  coordinator.Invalidate(first.epoch);

  const auto second = coordinator.Acquire();
  assert(second.epoch == first.epoch + 1);
  assert(provider->renew_calls() == 1);

  // A worker reporting the old epoch late must not trigger another renewal.
  coordinator.Invalidate(first.epoch);
  const auto third = coordinator.Acquire();
  assert(third.epoch == second.epoch);
  assert(provider->renew_calls() == 1);
}

void TestConcurrentInvalidationRenewsOnce() {
  auto                  provider = std::make_shared<FakeIdentityProvider>();
  CredentialCoordinator coordinator(provider, "default");
  const auto            rejected = coordinator.Acquire();

  provider->SetRenewDelay(50ms);

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      coordinator.Invalidate(rejected.epoch);
      (void)coordinator.Acquire();
    });
  }
  for (auto& thread : threads) thread.join();

  assert(provider->renew_calls() == 1);
  assert(coordinator.epoch() == rejected.epoch + 1);
}

void TestExplicitRefreshAdoptsNewerResult() {
  auto                  provider = std::make_shared<FakeIdentityProvider>();
  CredentialCoordinator coordinator(provider, "default");
  (void)coordinator.Acquire();

  provider->SetRenewDelay(50ms);
  std::thread other([&] { (void)coordinator.Refresh(); });
  std::this_thread::sleep_for(10ms);
  // Arrives while the other refresh is in flight and takes its result.
  const auto mine = coordinator.Acquire();
  other.join();

  assert(provider->renew_calls() == 1);
  assert(mine.epoch == 2);
}

void TestRenewalThatReturnsOlderCredentialKeepsCurrent() {
  auto                  provider = std::make_shared<FakeIdentityProvider>(2h);
  CredentialCoordinator coordinator(provider, "default");
  const auto            current = coordinator.Acquire();

  provider->SetLifetime(1h);
  const auto after = coordinator.Refresh();
  assert(after.epoch == current.epoch);
  assert(after.access_key_id == current.access_key_id);
  assert(coordinator.refresh_count() == 2);
}

void TestRejectedRenewalIsFatalForEveryone() {
  auto                  provider = std::make_shared<FakeIdentityProvider>();
  CredentialCoordinator coordinator(provider, "default");
  const auto            first = coordinator.Acquire();

  provider->FailRenew();
  provider->SetRenewDelay(30ms);
  coordinator.Invalidate(first.epoch);

  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&] {
      if (ThrowsAuthRefresh([&] { (void)coordinator.Acquire(); })) ++failures;
    });
  }
  for (auto& thread : threads) thread.join();

  assert(failures.load() == 6);
  assert(provider->renew_calls() == 1);
  assert(coordinator.Failed());
  assert(ThrowsAuthRefresh([&] { (void)coordinator.Refresh(); }));
  assert(provider->renew_calls() == 1);
}

void TestInitialAuthenticationFailure() {
  auto provider = std::make_shared<FakeIdentityProvider>();
  provider->FailAuthenticate();
  CredentialCoordinator coordinator(provider, "default");

  assert(ThrowsAuthRefresh([&] { (void)coordinator.Acquire(); }));
  assert(coordinator.Failed());
}

void TestParseProcessCredentials() {
  const auto credential = ProcessIdentityProvider::ParseProcessCredentials(
      R"({"Version": 1, "AccessKeyId": "AKIAEXAMPLE", "SecretAccessKey": "secret", "SessionToken": "token",
          "Expiration": "2030-01-02T03:04:05Z", "Extra": true})");

  assert(credential.access_key_id == "AKIAEXAMPLE");
  assert(credential.secret_access_key == "secret");
  assert(credential.session_token == "token");
  assert(swarm::util::ToUnixMillis(credential.expires_at) == 1893553445000ULL);

  const auto static_keys =
      ProcessIdentityProvider::ParseProcessCredentials(R"({"Version": 1, "AccessKeyId": "AKIA", "SecretAccessKey": "s"})");
  assert(static_keys.expires_at == swarm::util::TimePoint::max());

  assert(ThrowsAuthRefresh([] { (void)ProcessIdentityProvider::ParseProcessCredentials("not json"); }));
  assert(ThrowsAuthRefresh([] { (void)ProcessIdentityProvider::ParseProcessCredentials(R"({"Version": 2, "AccessKeyId": "A", "SecretAccessKey": "s"})"); }));
  assert(ThrowsAuthRefresh([] { (void)ProcessIdentityProvider::ParseProcessCredentials(R"({"Version": 1})"); }));
  assert(ThrowsAuthRefresh([] {
    (void)ProcessIdentityProvider::ParseProcessCredentials(R"({"Version": 1, "AccessKeyId": "A", "SecretAccessKey": "s", "Expiration": "soon"})");
  }));
}

void TestProcessProviderRunsCommands() {
  ProcessIdentityProvider provider(
      R"(echo '{"Version": 1, "AccessKeyId": "AKIA-{profile}", "SecretAccessKey": "s", "Expiration": "2099-01-01T00:00:00Z"}')", "true");

  const auto credential = provider.Authenticate("ops");
  assert(credential.access_key_id == "AKIA-ops");

  const auto renewed = provider.Renew("ops");
  assert(renewed.access_key_id == "AKIA-ops");

  ProcessIdentityProvider failing("false", "false");
  assert(ThrowsAuthRefresh([&] { (void)failing.Authenticate("ops"); }));
  assert(ThrowsAuthRefresh([&] { (void)failing.Renew("ops"); }));

  assert(ThrowsAuthRefresh([&] { (void)provider.Authenticate("ops; rm -rf /"); }));
}

void TestRenewLogsInOnlyWhenExportFails() {
  TempDir    dir("process_provider_login");
  const auto logged_in  = dir / "logged_in";
  const auto login_runs = dir / "login_runs";
  const std::string document =
      R"('{"Version": 1, "AccessKeyId": "AKIA", "SecretAccessKey": "s", "Expiration": "2099-01-01T00:00:00Z"}')";

  ProcessIdentityProvider provider("test -f " + logged_in + " && echo " + document,
                                   "echo run >> " + login_runs + " && touch " + logged_in);

  // No session yet: export fails, login runs once, export succeeds.
  assert(ThrowsAuthRefresh([&] { (void)provider.Authenticate("ops"); }));
  const auto renewed = provider.Renew("ops");
  assert(renewed.access_key_id == "AKIA");
  assert(std::filesystem::file_size(login_runs) == 4);

  // Session still valid: renewal never touches the login command.
  (void)provider.Renew("ops");
  assert(std::filesystem::file_size(login_runs) == 4);

  // Export succeeds but the credentials are already dead: log in again.
  ProcessIdentityProvider stale(
      R"(echo '{"Version": 1, "AccessKeyId": "OLD", "SecretAccessKey": "s", "Expiration": "2001-01-01T00:00:00Z"}')",
      "echo run >> " + login_runs);
  (void)stale.Renew("ops");
  assert(std::filesystem::file_size(login_runs) == 8);

  ProcessIdentityProvider rejected("false", "false");
  assert(ThrowsAuthRefresh([&] { (void)rejected.Renew("ops"); }));
}

} // namespace

int main() {
  TestFirstAcquireAuthenticatesOnce();
  TestExpiredCredentialIsNeverReturned();
  TestRefreshSkewRenewsEarly();
  TestConcurrentExpiryRenewsExactlyOnce();
  TestInvalidateOnlyAffectsCurrentEpoch();
  TestConcurrentInvalidationRenewsOnce();
  TestExplicitRefreshAdoptsNewerResult();
  TestRenewalThatReturnsOlderCredentialKeepsCurrent();
  TestRejectedRenewalIsFatalForEveryone();
  TestInitialAuthenticationFailure();
  TestParseProcessCredentials();
  TestProcessProviderRunsCommands();
  TestRenewLogsInOnlyWhenExportFails();

  std::cout << "swarm_unit_credential_coordinator: pass\n";
  return 0;
}
