#include "manifest_builder.hpp"

#include "internal/model/task_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/error_classifier.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/units.hpp"

namespace swarm::manifest {

using namespace swarm::observability;

ManifestBuilder::ManifestBuilder(std::shared_ptr<ManifestStore> manifest, std::shared_ptr<credential::CredentialCoordinator> credentials,
                                 storage::ObjectStorePtr store, std::string destination_root)
    : manifest_(std::move(manifest)), credentials_(std::move(credentials)), store_(std::move(store)),
      destination_root_(std::move(destination_root)) {
  if (!manifest_ || !credentials_ || !store_) {
    throw std::invalid_argument("ManifestBuilder: missing dependency");
  }
}

GenerationResult ManifestBuilder::Generate(const std::vector<std::string>& buckets) {
  GenerationResult result;

  for (const auto& bucket : buckets) {
    auto credential = credentials_->Acquire();

    bool accessible = false;
    try {
      accessible = store_->CheckAccess(credential, bucket);
    } catch (const util::TransferError& e) {
      if (e.category() == swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED) {
        credentials_->Invalidate(credential.epoch);
        credential = credentials_->Acquire();
        accessible = store_->CheckAccess(credential, bucket);
      } else {
        SWARM_LOG_WARN("Bucket check failed", {StringField("bucket", bucket), StringField("error", e.what())});
      }
    }
    if (!accessible) {
      SWARM_LOG_WARN("Skipping inaccessible bucket", {StringField("bucket", bucket)});
      result.inaccessible_buckets.push_back(bucket);
      continue;
    }

    uint64_t bucket_added = 0;
    uint64_t bucket_bytes = 0;

    store_->List(credential, bucket, "", [&](const storage::ObjectEntry& entry) {
      if (entry.key.empty() || entry.key.back() == '/' || entry.size_bytes == 0) {
        ++result.skipped_entries;
        return;
      }

      const auto destination = storage::common::DestinationPath(destination_root_, bucket, entry.key);
      try {
        storage::common::ValidateDestination(destination_root_, destination);
      } catch (const util::TransferError&) {
        SWARM_LOG_WARN("Skipping object with unsafe key", {StringField("bucket", bucket), StringField("key", entry.key)});
        ++result.skipped_entries;
        return;
      }

      swarm::v1::Task task;
      *task.mutable_key() = model::MakeKey(bucket, entry.key);
      task.set_size_bytes(entry.size_bytes);
      task.set_destination(destination.string());

      if (manifest_->AddTask(std::move(task))) {
        ++bucket_added;
        bucket_bytes += entry.size_bytes;
      } else {
        ++result.existing;
      }
    });

    result.added += bucket_added;
    result.bytes += bucket_bytes;
    SWARM_LOG_INFO("Bucket enumerated", {StringField("bucket", bucket), IntField("objects", static_cast<int64_t>(bucket_added)),
                                         StringField("size", util::FormatSize(bucket_bytes))});
  }

  manifest_->Persist();

  SWARM_LOG_INFO("Manifest generated", {StringField("path", manifest_->path()), IntField("added", static_cast<int64_t>(result.added)),
                                        IntField("existing", static_cast<int64_t>(result.existing)),
                                        StringField("size", util::FormatSize(result.bytes))});
  return result;
}

} // namespace swarm::manifest
