#include "manifest_codec.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace swarm::manifest {

namespace {

[[noreturn]] void ThrowErrno(const std::string& what, const std::string& path) {
  throw std::runtime_error(what + " " + path + ": " + std::strerror(errno));
}

void FsyncDirectory(const std::filesystem::path& dir) {
  const auto target = dir.empty() ? std::filesystem::path(".") : dir;
  int        fd     = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return;
  }
  ::fsync(fd);
  ::close(fd);
}

} // namespace

std::string EncodeManifest(const swarm::v1::Manifest& manifest) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(manifest, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode manifest: " + std::string(status.message()));
  }
  return json;
}

swarm::v1::Manifest DecodeManifest(const std::string& text) {
  swarm::v1::Manifest manifest;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(text, &manifest, options);
  if (!status.ok()) {
    throw util::ManifestCorruptError("manifest does not parse: " + std::string(status.message()));
  }

  if (manifest.format_version() != kManifestFormatVersion) {
    throw util::ManifestCorruptError("unsupported manifest format version " + std::to_string(manifest.format_version()));
  }

  if (manifest.task_count() != static_cast<uint64_t>(manifest.tasks_size())) {
    throw util::ManifestCorruptError("manifest task count mismatch: header " + std::to_string(manifest.task_count()) + ", body " +
                                     std::to_string(manifest.tasks_size()));
  }

  return manifest;
}

swarm::v1::Manifest ReadManifestFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (!std::filesystem::exists(path)) {
      throw util::NotFound("manifest not found: " + path);
    }
    throw util::ManifestCorruptError("manifest unreadable: " + path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::ManifestCorruptError("manifest read failed: " + path);
  }

  try {
    return DecodeManifest(buffer.str());
  } catch (const util::ManifestCorruptError& e) {
    throw util::ManifestCorruptError(path + ": " + e.what());
  }
}

void WriteFileAtomic(const std::string& path, const std::string& contents) {
  const std::filesystem::path target(path);
  const std::string           tmp = path + ".tmp";

  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    ThrowErrno("open", tmp);
  }

  const char* data      = contents.data();
  size_t      remaining = contents.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, data, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      ::close(fd);
      ThrowErrno("write", tmp);
    }
    data += n;
    remaining -= static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    ::close(fd);
    ThrowErrno("fsync", tmp);
  }
  if (::close(fd) != 0) {
    ThrowErrno("close", tmp);
  }

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    ThrowErrno("rename", tmp);
  }

  FsyncDirectory(target.parent_path());
}

void WriteManifestFileAtomic(const std::string& path, const swarm::v1::Manifest& manifest) {
  WriteFileAtomic(path, EncodeManifest(manifest));
}

} // namespace swarm::manifest
