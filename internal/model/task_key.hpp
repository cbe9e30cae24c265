#pragma once

#include <string>

#include "swarm/v1/manifest.pb.h"

namespace swarm::model {

inline swarm::v1::TaskKey MakeKey(const std::string& container, const std::string& object) {
  swarm::v1::TaskKey key;
  key.set_container(container);
  key.set_object(object);
  return key;
}

// Flat map key. Bucket names never contain '/', so the split is unambiguous.
inline std::string KeyString(const swarm::v1::TaskKey& key) {
  return key.container() + "/" + key.object();
}

inline const char* StatusName(swarm::v1::TaskStatus status) {
  switch (status) {
    case swarm::v1::TASK_STATUS_PENDING:
      return "pending";
    case swarm::v1::TASK_STATUS_IN_PROGRESS:
      return "in_progress";
    case swarm::v1::TASK_STATUS_COMPLETED:
      return "completed";
    case swarm::v1::TASK_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace swarm::model
