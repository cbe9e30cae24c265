#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/credential/credential_coordinator.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/runtime/shutdown_signal.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/transfer/retry_policy.hpp"
#include "internal/transfer/task_worker.hpp"

namespace swarm::factory {

/*
  Application

  Owns all long-lived components of one run.
*/
struct Application {
  std::shared_ptr<manifest::ManifestStore>           manifest;
  std::shared_ptr<lease::LeaseManager>               leases;
  std::shared_ptr<credential::CredentialCoordinator> credentials;
  storage::ObjectStorePtr                            store;
  std::shared_ptr<runtime::ShutdownSignal>           shutdown;

  transfer::WorkerDependencies WorkerDeps() const {
    return {manifest, leases, credentials, store, shutdown};
  }
};

/*
  Build

  Composition root. The only place that knows the concrete object store
  and identity provider. Opens the manifest, so it throws
  util::ManifestCorruptError for an unreadable one.
*/
Application Build(const swarm::runtime::config::RuntimeConfig& config);

} // namespace swarm::factory
