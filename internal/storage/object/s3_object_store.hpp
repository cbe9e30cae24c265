#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <arrow/filesystem/s3fs.h>

#include "config/config.pb.h"
#include "internal/storage/object_store.hpp"

namespace swarm::storage {

/*
  Object storage client (S3 / MinIO) on the Arrow filesystem layer.

  One S3FileSystem is shared by all workers. It is rebuilt when a
  credential with a newer epoch is presented; requests carrying an older
  epoch keep using the newer connection.

  Downloads stream into <destination>.part and are renamed into place only
  after the full object has been written.
*/
class S3ObjectStore final : public ObjectStore {
 public:
  explicit S3ObjectStore(swarm::runtime::config::ObjectStoreConfig config);

  bool CheckAccess(const credential::Credential& credential, const std::string& container) override;

  void List(const credential::Credential& credential, const std::string& container, const std::string& prefix,
            const ListVisitor& visit) override;

  ObjectMetadata HeadMetadata(const credential::Credential& credential, const std::string& container, const std::string& key) override;

  uint64_t Download(const credential::Credential& credential, const std::string& container, const std::string& key,
                    const std::string& destination, uint64_t expected_bytes, const CancelCheck& cancelled) override;

  // Must be called once after the last S3ObjectStore is destroyed.
  static void Finalize();

 private:
  std::shared_ptr<arrow::fs::S3FileSystem> FileSystemFor(const credential::Credential& credential);

  static std::string ObjectPath(const std::string& container, const std::string& key);

  swarm::runtime::config::ObjectStoreConfig config_;

  std::mutex                               mutex_;
  std::shared_ptr<arrow::fs::S3FileSystem> fs_;
  uint64_t                                 bound_epoch_ = 0;
};

} // namespace swarm::storage
