#include "units.hpp"

#include <array>
#include <cstdio>

namespace swarm::util {

std::string FormatSize(uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};

  double value = static_cast<double>(bytes);
  size_t unit  = 0;
  while (value >= 1024.0 && unit < kUnits.size() - 1) {
    value /= 1024.0;
    ++unit;
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
  return buf;
}

} // namespace swarm::util
