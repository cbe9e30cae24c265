#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace swarm::storage::common {

// <root>/<container>/<key>, lexically normalized.
inline std::filesystem::path DestinationPath(const std::filesystem::path& root, const std::string& container, const std::string& key) {
  return (root / container / key).lexically_normal();
}

/*
  Rejects destinations that are empty, name a directory, or escape `root`
  (keys with ".." components or a leading '/').
*/
inline void ValidateDestination(const std::filesystem::path& root, const std::filesystem::path& destination) {
  if (destination.empty() || !destination.has_filename()) {
    throw util::TransferError(swarm::v1::ERROR_CATEGORY_INVALID_DESTINATION, "destination path is empty or a directory: " + destination.string());
  }

  auto normal_root = root.lexically_normal();
  if (!normal_root.has_filename() && normal_root.has_parent_path() && normal_root != normal_root.root_path()) {
    normal_root = normal_root.parent_path();
  }
  const auto relative    = destination.lexically_normal().lexically_relative(normal_root);
  if (relative.empty() || *relative.begin() == "..") {
    throw util::TransferError(swarm::v1::ERROR_CATEGORY_INVALID_DESTINATION,
                              "destination escapes " + normal_root.string() + ": " + destination.string());
  }
}

} // namespace swarm::storage::common
