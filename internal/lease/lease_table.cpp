#include "lease_table.hpp"

#include "internal/model/task_key.hpp"

namespace swarm::lease {

bool LeaseTable::Insert(const Lease& lease) {
  std::lock_guard lock(mutex_);
  return by_key_.emplace(model::KeyString(lease.key), lease).second;
}

bool LeaseTable::Remove(const Lease& lease) {
  std::lock_guard lock(mutex_);

  auto it = by_key_.find(model::KeyString(lease.key));
  if (it == by_key_.end() || it->second.lease_id != lease.lease_id) {
    return false;
  }

  by_key_.erase(it);
  return true;
}

bool LeaseTable::HasActive(const swarm::v1::TaskKey& key) {
  std::lock_guard lock(mutex_);
  return by_key_.count(model::KeyString(key)) > 0;
}

size_t LeaseTable::Size() {
  std::lock_guard lock(mutex_);
  return by_key_.size();
}

} // namespace swarm::lease
