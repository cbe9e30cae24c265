#include "s3_object_store.hpp"

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>

#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace swarm::storage {

using namespace swarm::storage::common;

namespace {

constexpr int64_t kChunkBytes = 8 * 1024 * 1024;

util::TimePoint ToTimePoint(arrow::fs::TimePoint tp) {
  return std::chrono::time_point_cast<util::Clock::duration>(tp);
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

S3ObjectStore::S3ObjectStore(swarm::runtime::config::ObjectStoreConfig config) : config_(std::move(config)) {
  Unwrap(arrow::fs::EnsureS3Initialized(), "initialize S3");
}

void S3ObjectStore::Finalize() {
  auto status = arrow::fs::FinalizeS3();
  if (!status.ok()) {
    SWARM_LOG_WARN("S3 finalization failed", {observability::StringField("error", status.ToString())});
  }
}

std::string S3ObjectStore::ObjectPath(const std::string& container, const std::string& key) {
  if (key.empty()) {
    return container;
  }
  return container + "/" + key;
}

std::shared_ptr<arrow::fs::S3FileSystem> S3ObjectStore::FileSystemFor(const credential::Credential& credential) {
  std::lock_guard lock(mutex_);
  if (fs_ && credential.epoch <= bound_epoch_) {
    return fs_;
  }

  auto options = credential.access_key_id.empty()
                     ? arrow::fs::S3Options::Defaults()
                     : arrow::fs::S3Options::FromAccessKey(credential.access_key_id, credential.secret_access_key, credential.session_token);
  if (!config_.region().empty()) options.region = config_.region();
  if (!config_.endpoint_override().empty()) options.endpoint_override = config_.endpoint_override();
  options.scheme                   = config_.scheme();
  options.connect_timeout          = config_.connect_timeout_seconds();
  options.request_timeout          = config_.request_timeout_seconds();
  options.force_virtual_addressing = config_.force_virtual_addressing();

  fs_          = Unwrap(arrow::fs::S3FileSystem::Make(options), "connect S3");
  bound_epoch_ = credential.epoch;
  SWARM_LOG_DEBUG("S3 filesystem bound", {observability::IntField("credential_epoch", static_cast<int64_t>(bound_epoch_))});
  return fs_;
}

bool S3ObjectStore::CheckAccess(const credential::Credential& credential, const std::string& container) {
  auto fs     = FileSystemFor(credential);
  auto result = fs->GetFileInfo(container);
  if (!result.ok()) {
    SWARM_LOG_WARN("No access to bucket",
                   {observability::StringField("bucket", container), observability::StringField("error", result.status().ToString())});
    return false;
  }
  return result->type() == arrow::fs::FileType::Directory;
}

void S3ObjectStore::List(const credential::Credential& credential, const std::string& container, const std::string& prefix,
                         const ListVisitor& visit) {
  auto fs = FileSystemFor(credential);

  arrow::fs::FileSelector selector;
  selector.base_dir        = ObjectPath(container, prefix);
  selector.recursive       = true;
  selector.allow_not_found = true;

  auto infos = Unwrap(fs->GetFileInfo(selector), "list " + selector.base_dir);

  const auto strip = container.size() + 1;
  for (const auto& info : infos) {
    if (info.type() != arrow::fs::FileType::File) {
      continue;
    }
    const auto& path = info.path();
    if (path.size() <= strip) {
      continue;
    }
    visit(ObjectEntry{path.substr(strip), static_cast<uint64_t>(info.size())});
  }
}

ObjectMetadata S3ObjectStore::HeadMetadata(const credential::Credential& credential, const std::string& container, const std::string& key) {
  auto       fs   = FileSystemFor(credential);
  const auto path = ObjectPath(container, key);
  auto       info = Unwrap(fs->GetFileInfo(path), "head " + path);

  if (info.type() != arrow::fs::FileType::File) {
    throw util::TransferError(swarm::v1::ERROR_CATEGORY_NOT_FOUND, "object no longer exists: " + path);
  }

  return ObjectMetadata{static_cast<uint64_t>(info.size()), ToTimePoint(info.mtime())};
}

uint64_t S3ObjectStore::Download(const credential::Credential& credential, const std::string& container, const std::string& key,
                                 const std::string& destination, uint64_t expected_bytes, const CancelCheck& cancelled) {
  auto       fs   = FileSystemFor(credential);
  const auto path = ObjectPath(container, key);

  const std::filesystem::path target(destination);
  const std::filesystem::path partial(destination + ".part");

  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    throw util::TransferError(swarm::v1::ERROR_CATEGORY_INVALID_DESTINATION,
                              "cannot create " + target.parent_path().string() + ": " + ec.message());
  }

  uint64_t written = 0;
  try {
    auto input  = Unwrap(fs->OpenInputStream(path), "open " + path);
    auto output = Unwrap(arrow::io::FileOutputStream::Open(partial.string()), "create " + partial.string());

    while (true) {
      if (cancelled && cancelled()) {
        throw util::TransferError(swarm::v1::ERROR_CATEGORY_TRANSIENT, "download cancelled: " + path);
      }

      auto chunk = Unwrap(input->Read(kChunkBytes), "read " + path);
      if (chunk->size() == 0) {
        break;
      }
      Unwrap(output->Write(chunk->data(), chunk->size()), "write " + partial.string());
      written += static_cast<uint64_t>(chunk->size());
    }

    Unwrap(output->Close(), "close " + partial.string());
    Unwrap(input->Close(), "close " + path);

    if (written != expected_bytes) {
      throw util::TransferError(swarm::v1::ERROR_CATEGORY_TRANSIENT, "truncated transfer: " + std::to_string(written) + " of " +
                                                                         std::to_string(expected_bytes) + " bytes for " + path);
    }
  } catch (...) {
    RemoveQuietly(partial);
    throw;
  }

  std::filesystem::rename(partial, target, ec);
  if (ec) {
    RemoveQuietly(partial);
    throw util::TransferError(swarm::v1::ERROR_CATEGORY_INVALID_DESTINATION, "cannot move into " + destination + ": " + ec.message());
  }

  return written;
}

} // namespace swarm::storage
