#pragma once

#include <stdexcept>
#include <string>

#include "swarm/v1/manifest.pb.h"

namespace swarm::util {

/*
  Central error types.

  Task-level errors (TransferError, LeaseConflict) are recorded in the
  manifest. Run-level errors (ManifestCorruptError, AuthRefreshError) abort
  the scheduler and surface as a non-zero exit code.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persisted manifest cannot be parsed. Run-fatal.
class ManifestCorruptError : public std::runtime_error {
 public:
  explicit ManifestCorruptError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Identity provider rejected authentication or renewal. Run-fatal.
class AuthRefreshError : public std::runtime_error {
 public:
  explicit AuthRefreshError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A classified failure from the object store client.
class TransferError : public std::runtime_error {
 public:
  TransferError(swarm::v1::ErrorCategory category, const std::string& msg) : std::runtime_error(msg), category_(category) {
  }

  swarm::v1::ErrorCategory category() const {
    return category_;
  }

 private:
  swarm::v1::ErrorCategory category_;
};

} // namespace swarm::util
