#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/credential/credential_coordinator.hpp"
#include "internal/storage/object_store.hpp"
#include "manifest_store.hpp"

namespace swarm::manifest {

struct GenerationResult {
  uint64_t added           = 0;
  uint64_t existing        = 0;
  uint64_t bytes           = 0;
  uint64_t skipped_entries = 0;

  std::vector<std::string> inaccessible_buckets;
};

/*
  Generation pass: enumerates every bucket and adds one pending task per
  object. Folder markers and zero-size placeholders are excluded. Existing
  tasks keep their state, so regenerating over a partly finished manifest
  only adds what is new.
*/
class ManifestBuilder {
 public:
  ManifestBuilder(std::shared_ptr<ManifestStore> manifest, std::shared_ptr<credential::CredentialCoordinator> credentials,
                  storage::ObjectStorePtr store, std::string destination_root);

  GenerationResult Generate(const std::vector<std::string>& buckets);

 private:
  std::shared_ptr<ManifestStore>                     manifest_;
  std::shared_ptr<credential::CredentialCoordinator> credentials_;
  storage::ObjectStorePtr                            store_;
  std::string                                        destination_root_;
};

} // namespace swarm::manifest
