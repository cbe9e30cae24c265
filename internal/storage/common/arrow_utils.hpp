#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <string>

#include "internal/storage/error_classifier.hpp"
#include "internal/util/errors.hpp"

namespace swarm::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw a classified util::TransferError
*/
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) {
    const auto message = context + ": " + result.status().ToString();
    throw util::TransferError(ClassifyStorageError(message), message);
  }
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) {
    const auto message = context + ": " + status.ToString();
    throw util::TransferError(ClassifyStorageError(message), message);
  }
}

} // namespace swarm::storage::common
