#pragma once

#include <string>

#include "swarm/v1/manifest.pb.h"

namespace swarm::manifest {

inline constexpr uint32_t kManifestFormatVersion = 1;

/*
  Manifest on-disk form: the protobuf Manifest rendered as JSON.

  JSON is chosen over the binary wire format because a truncated JSON
  document never parses, so a partial write is always detected.
*/
std::string EncodeManifest(const swarm::v1::Manifest& manifest);

// Throws util::ManifestCorruptError.
swarm::v1::Manifest DecodeManifest(const std::string& text);

// Throws util::NotFound if the file does not exist, ManifestCorruptError if unreadable.
swarm::v1::Manifest ReadManifestFile(const std::string& path);

// Atomic with respect to concurrent readers: see WriteFileAtomic.
void WriteManifestFileAtomic(const std::string& path, const swarm::v1::Manifest& manifest);

// Writes <path>.tmp, fsyncs it and renames it over <path>.
void WriteFileAtomic(const std::string& path, const std::string& contents);

} // namespace swarm::manifest
