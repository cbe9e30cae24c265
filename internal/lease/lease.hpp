#pragma once

#include <chrono>
#include <string>

#include "swarm/v1/manifest.pb.h"

namespace swarm::lease {

/*
  Exclusive ownership of one task for a worker's whole retry lifetime.
  Leases do not expire; a lease left by a crashed process is cleared by
  the operator (s3swarm --clear-leases).
*/
struct Lease {
  std::string        lease_id;
  swarm::v1::TaskKey key;
  std::string        owner_id;

  std::chrono::system_clock::time_point acquired_at;
};

}
