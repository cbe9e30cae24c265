#pragma once

#include <cstdint>
#include <string>

namespace swarm::util {

// 1536 -> "1.5 KB"
std::string FormatSize(uint64_t bytes);

} // namespace swarm::util
