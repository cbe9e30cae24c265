#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "lease.hpp"

namespace swarm::lease {

// In-process lease index: at most one lease per task key.
class LeaseTable {
 public:
  // False if the key is already leased.
  bool Insert(const Lease& lease);

  // Removes the entry only if it still belongs to `lease`. Returns whether
  // anything was removed.
  bool Remove(const Lease& lease);

  bool HasActive(const swarm::v1::TaskKey& key);

  size_t Size();

 private:
  std::mutex mutex_;

  std::unordered_map<std::string, Lease> by_key_;
};

} // namespace swarm::lease
