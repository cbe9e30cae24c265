#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace swarm::util {

/*
  UUID helpers

  Lease owners are identified by a random RFC4122 v4 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace swarm::util
