#include "bucket_list.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace swarm::manifest {

namespace {

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

} // namespace

std::vector<std::string> ParseBucketList(const std::string& text) {
  std::vector<std::string>        buckets;
  std::unordered_set<std::string> seen;

  std::istringstream in(text);
  std::string        line;
  while (std::getline(in, line)) {
    auto name = Trim(line);
    if (name.empty() || name.front() == '#') continue;
    if (seen.insert(name).second) buckets.push_back(std::move(name));
  }
  return buckets;
}

std::vector<std::string> LoadBucketList(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("bucket list not found: " + path);
  }

  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot read bucket list: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseBucketList(buffer.str());
}

} // namespace swarm::manifest
