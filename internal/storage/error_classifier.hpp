#pragma once

#include <string_view>

#include "swarm/v1/manifest.pb.h"

namespace swarm::storage {

/*
  Maps object-store error text (AWS error codes, curl/socket messages) to
  an ErrorCategory. Anything unrecognised is ERROR_CATEGORY_UNKNOWN, which
  is treated as permanent.
*/
swarm::v1::ErrorCategory ClassifyStorageError(std::string_view message);

// Transient and auth-expired failures are retried within a task.
bool IsRetryable(swarm::v1::ErrorCategory category);

const char* ErrorCategoryName(swarm::v1::ErrorCategory category);

} // namespace swarm::storage
