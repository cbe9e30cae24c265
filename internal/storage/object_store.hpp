#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/credential/credential.hpp"
#include "internal/util/time.hpp"

namespace swarm::storage {

struct ObjectEntry {
  std::string key;
  uint64_t    size_bytes = 0;
};

struct ObjectMetadata {
  uint64_t        size_bytes = 0;
  util::TimePoint last_modified;
};

/*
  Object storage client boundary.

  Every call takes the credential it should authenticate with; the
  implementation decides whether that requires a new connection.

  Failures are reported as util::TransferError with a classified
  ErrorCategory. Nothing here ever mutates or deletes source objects.
*/
class ObjectStore {
 public:
  using ListVisitor = std::function<void(const ObjectEntry&)>;
  using CancelCheck = std::function<bool()>;

  virtual ~ObjectStore() = default;

  virtual bool CheckAccess(const credential::Credential& credential, const std::string& container) = 0;

  // Recursive listing. Restartable from the start only.
  virtual void List(const credential::Credential& credential, const std::string& container, const std::string& prefix,
                    const ListVisitor& visit) = 0;

  // Throws TransferError(ERROR_CATEGORY_NOT_FOUND) if the object vanished.
  virtual ObjectMetadata HeadMetadata(const credential::Credential& credential, const std::string& container, const std::string& key) = 0;

  // Returns bytes written. The object only appears at `destination` once
  // exactly `expected_bytes` were written; a short or long transfer, like a
  // cancelled one (`cancelled` is polled between chunks), throws
  // TransferError(ERROR_CATEGORY_TRANSIENT) and leaves nothing behind.
  virtual uint64_t Download(const credential::Credential& credential, const std::string& container, const std::string& key,
                            const std::string& destination, uint64_t expected_bytes, const CancelCheck& cancelled) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace swarm::storage
