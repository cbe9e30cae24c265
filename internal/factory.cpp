#include "factory.hpp"

#include "internal/credential/process_identity_provider.hpp"
#include "internal/storage/object/s3_object_store.hpp"
#include "internal/util/time.hpp"

namespace swarm::factory {

/*
    Build full application dependency graph
*/
Application Build(const swarm::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Manifest
  // ------------------------------------------------------------------
  manifest::ManifestStore::Options manifest_options;
  manifest_options.path                    = config.transfer().manifest();
  manifest_options.flush_every_transitions = config.manifest().flush_every_transitions();

  app.manifest = std::make_shared<manifest::ManifestStore>(manifest_options);
  app.manifest->Open();

  // ------------------------------------------------------------------
  // Coordination
  // ------------------------------------------------------------------
  app.leases = std::make_shared<lease::LeaseManager>(config.leases().directory());

  const auto& credentials = config.credentials();
  auto        provider    = std::make_shared<credential::ProcessIdentityProvider>(credentials.authenticate_command(), credentials.renew_command());
  app.credentials         = std::make_shared<credential::CredentialCoordinator>(std::move(provider), credentials.profile(),
                                                                                 util::ToMillis(credentials.refresh_skew()));

  // ------------------------------------------------------------------
  // Object storage
  // ------------------------------------------------------------------
  app.store = std::make_shared<storage::S3ObjectStore>(config.object_store());

  app.shutdown = std::make_shared<runtime::ShutdownSignal>();

  return app;
}

} // namespace swarm::factory
