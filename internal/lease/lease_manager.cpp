#include "lease_manager.hpp"

#include <atomic>

#include "internal/model/task_key.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace swarm::lease {

LeaseManager::LeaseManager(const std::string& marker_directory) : owner_id_(util::ToString(util::GenerateUUID())) {
  if (!marker_directory.empty()) {
    markers_ = std::make_unique<MarkerStore>(marker_directory);
  }
}

std::string LeaseManager::GenerateLeaseID() const {
  static std::atomic<uint64_t> next{1};
  return owner_id_ + "#" + std::to_string(next.fetch_add(1));
}

Lease LeaseManager::Acquire(const swarm::v1::TaskKey& key) {
  Lease lease;
  lease.lease_id    = GenerateLeaseID();
  lease.key         = key;
  lease.owner_id    = owner_id_;
  lease.acquired_at = util::Now();

  if (!table_.Insert(lease)) {
    throw util::LeaseConflict("task already leased in this process: " + model::KeyString(key));
  }

  if (markers_) {
    bool created = false;
    try {
      created = markers_->Create(lease);
    } catch (...) {
      table_.Remove(lease);
      throw;
    }
    if (!created) {
      table_.Remove(lease);
      throw util::LeaseConflict("lease marker exists for " + model::KeyString(key));
    }
  }

  return lease;
}

void LeaseManager::Release(const Lease& lease) {
  if (!table_.Remove(lease)) {
    return;
  }
  if (markers_) {
    markers_->Remove(lease.key, lease.owner_id);
  }
}

void LeaseManager::Abandon(const Lease& lease) {
  table_.Remove(lease);
}

bool LeaseManager::IsHeld(const swarm::v1::TaskKey& key) {
  return table_.HasActive(key) || HasMarker(key);
}

bool LeaseManager::HasMarker(const swarm::v1::TaskKey& key) const {
  return markers_ && markers_->Exists(key);
}

std::vector<swarm::v1::LeaseMarker> LeaseManager::ListMarkers() const {
  if (!markers_) return {};
  return markers_->List();
}

size_t LeaseManager::ClearMarkers() {
  if (!markers_) return 0;
  return markers_->Clear();
}

} // namespace swarm::lease
