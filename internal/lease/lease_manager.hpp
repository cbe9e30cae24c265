#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lease.hpp"
#include "lease_table.hpp"
#include "marker_store.hpp"

namespace swarm::lease {

/*
  Grants exclusive task ownership.

  Two layers: the in-process table stops two workers of this run from
  claiming the same task, and (when a marker directory is configured) an
  on-disk marker stops a second process from claiming it. A conflict on
  either layer throws util::LeaseConflict and leaves no trace.
*/
class LeaseManager {
 public:
  // Empty `marker_directory` keeps leases in-process only.
  explicit LeaseManager(const std::string& marker_directory = {});

  // Throws util::LeaseConflict.
  Lease Acquire(const swarm::v1::TaskKey& key);

  // Idempotent.
  void Release(const Lease& lease);

  // Forgets the lease in this process but keeps its marker, so the task stays
  // ineligible for later runs until the marker is cleared.
  void Abandon(const Lease& lease);

  bool IsHeld(const swarm::v1::TaskKey& key);

  // True if an on-disk marker exists for `key` (held by anyone).
  bool HasMarker(const swarm::v1::TaskKey& key) const;

  std::vector<swarm::v1::LeaseMarker> ListMarkers() const;
  size_t                              ClearMarkers();

  const std::string& owner_id() const {
    return owner_id_;
  }

 private:
  std::string GenerateLeaseID() const;

  std::string                  owner_id_;
  LeaseTable                   table_;
  std::unique_ptr<MarkerStore> markers_;
};

} // namespace swarm::lease
