#include "marker_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/model/task_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace swarm::lease {

namespace {

constexpr char kMarkerSuffix[] = ".lease";

uint64_t Fnv1a64(const std::string& data) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

bool SameKey(const swarm::v1::TaskKey& a, const swarm::v1::TaskKey& b) {
  return a.container() == b.container() && a.object() == b.object();
}

std::string HostName() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    return "unknown";
  }
  return buf;
}

std::string EncodeMarker(const Lease& lease) {
  swarm::v1::LeaseMarker marker;
  marker.set_owner_id(lease.owner_id);
  marker.set_pid(static_cast<int64_t>(::getpid()));
  marker.set_host(HostName());
  *marker.mutable_key()         = lease.key;
  *marker.mutable_acquired_at() = util::ToProto(lease.acquired_at);

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(marker, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode lease marker: " + std::string(status.message()));
  }
  json.push_back('\n');
  return json;
}

bool ReadMarker(const std::filesystem::path& path, swarm::v1::LeaseMarker* marker) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(buffer.str(), marker, options).ok();
}

} // namespace

MarkerStore::MarkerStore(std::filesystem::path directory) : directory_(std::move(directory)) {
  std::filesystem::create_directories(directory_);
}

std::filesystem::path MarkerStore::MarkerPath(const swarm::v1::TaskKey& key) const {
  char name[32];
  std::snprintf(name, sizeof(name), "%016llx", static_cast<unsigned long long>(Fnv1a64(model::KeyString(key))));
  return directory_ / (std::string(name) + kMarkerSuffix);
}

bool MarkerStore::Create(const Lease& lease) {
  const auto path = MarkerPath(lease.key);

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      swarm::v1::LeaseMarker marker;
      if (ReadMarker(path, &marker) && marker.has_key() && !SameKey(marker.key(), lease.key)) {
        SWARM_LOG_WARN("Lease marker name collision, task cannot be leased until the other marker is gone",
                       {observability::StringField("task", model::KeyString(lease.key)),
                        observability::StringField("marker_task", model::KeyString(marker.key())),
                        observability::StringField("path", path.string())});
      }
      return false;
    }
    throw std::runtime_error("create lease marker " + path.string() + ": " + std::strerror(errno));
  }

  const auto body = EncodeMarker(lease);
  bool       ok   = ::write(fd, body.data(), body.size()) == static_cast<ssize_t>(body.size());
  ok              = (::fsync(fd) == 0) && ok;
  ok              = (::close(fd) == 0) && ok;
  if (!ok) {
    const auto reason = std::string(std::strerror(errno));
    ::unlink(path.c_str());
    throw std::runtime_error("write lease marker " + path.string() + ": " + reason);
  }
  return true;
}

void MarkerStore::Remove(const swarm::v1::TaskKey& key, const std::string& owner_id) {
  const auto path = MarkerPath(key);

  swarm::v1::LeaseMarker marker;
  if (ReadMarker(path, &marker)) {
    if (marker.has_key() && !SameKey(marker.key(), key)) {
      SWARM_LOG_WARN("Lease marker belongs to another task, left in place",
                     {observability::StringField("task", model::KeyString(key)),
                      observability::StringField("marker_task", model::KeyString(marker.key()))});
      return;
    }
    if (marker.owner_id() != owner_id) {
      SWARM_LOG_WARN("Lease marker owned by another process left in place",
                     {observability::StringField("task", model::KeyString(key)), observability::StringField("owner", marker.owner_id())});
      return;
    }
  }

  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    SWARM_LOG_WARN("Failed to remove lease marker",
                   {observability::StringField("path", path.string()), observability::StringField("error", ec.message())});
  }
}

bool MarkerStore::Exists(const swarm::v1::TaskKey& key) const {
  std::error_code ec;
  return std::filesystem::exists(MarkerPath(key), ec);
}

std::vector<swarm::v1::LeaseMarker> MarkerStore::List() const {
  std::vector<swarm::v1::LeaseMarker> markers;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != kMarkerSuffix) {
      continue;
    }
    swarm::v1::LeaseMarker marker;
    if (!ReadMarker(entry.path(), &marker)) {
      marker.Clear();
    }
    markers.push_back(std::move(marker));
  }
  return markers;
}

size_t MarkerStore::Clear() {
  size_t removed = 0;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != kMarkerSuffix) {
      continue;
    }
    std::error_code remove_ec;
    if (std::filesystem::remove(entry.path(), remove_ec)) {
      ++removed;
    }
  }
  return removed;
}

} // namespace swarm::lease
