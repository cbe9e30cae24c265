#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "lease.hpp"
#include "swarm/v1/manifest.pb.h"

namespace swarm::lease {

/*
  On-disk lease markers, one file per leased task:

      <directory>/<fnv1a64(container/object)>.lease

  Creation uses O_CREAT|O_EXCL, so exactly one process wins a race for the
  same key. The body is a JSON LeaseMarker naming the owner and the key, for
  operators inspecting a directory left behind by a crashed run.

  Two keys whose names hash alike share a marker path: the second cannot be
  leased while the first holds it (logged as a collision) and a release
  never removes a marker naming a different key. At 64 bits this needs
  billions of tasks to become likely.
*/
class MarkerStore {
 public:
  // Creates `directory` if needed.
  explicit MarkerStore(std::filesystem::path directory);

  // False if a marker for the key already exists. Throws std::runtime_error on I/O failure.
  bool Create(const Lease& lease);

  // Removes the marker if it is owned by `owner_id`. Missing markers are ignored.
  void Remove(const swarm::v1::TaskKey& key, const std::string& owner_id);

  bool Exists(const swarm::v1::TaskKey& key) const;

  // Unreadable markers are returned as empty messages.
  std::vector<swarm::v1::LeaseMarker> List() const;

  // Removes every marker. Returns the number removed.
  size_t Clear();

  const std::filesystem::path& directory() const {
    return directory_;
  }

 private:
  std::filesystem::path MarkerPath(const swarm::v1::TaskKey& key) const;

  std::filesystem::path directory_;
};

} // namespace swarm::lease
