#pragma once

#include <string>
#include <vector>

namespace swarm::manifest {

// One bucket per line. Whitespace is trimmed; blank lines and lines starting
// with '#' are ignored; duplicates are dropped in first-seen order.
// Throws util::NotFound if the file does not exist.
std::vector<std::string> LoadBucketList(const std::string& path);

std::vector<std::string> ParseBucketList(const std::string& text);

} // namespace swarm::manifest
