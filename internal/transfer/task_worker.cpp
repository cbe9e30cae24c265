#include "task_worker.hpp"

#include <chrono>
#include <filesystem>

#include "internal/model/task_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/error_classifier.hpp"
#include "internal/util/errors.hpp"

namespace swarm::transfer {

using namespace swarm::observability;
using swarm::v1::TaskStatus;

const char* WorkerStateName(WorkerState state) {
  switch (state) {
    case WorkerState::kIdle:
      return "idle";
    case WorkerState::kLeaseAcquired:
      return "lease_acquired";
    case WorkerState::kTransferring:
      return "transferring";
    case WorkerState::kRetryPending:
      return "retry_pending";
    case WorkerState::kSucceeded:
      return "succeeded";
    case WorkerState::kFailed:
      return "failed";
  }
  return "unknown";
}

const char* TaskOutcomeName(TaskOutcome outcome) {
  switch (outcome) {
    case TaskOutcome::kCompleted:
      return "completed";
    case TaskOutcome::kFailed:
      return "failed";
    case TaskOutcome::kSkipped:
      return "skipped";
    case TaskOutcome::kAbandoned:
      return "abandoned";
  }
  return "unknown";
}

TaskWorker::TaskWorker(WorkerDependencies deps, RetryPolicy policy, std::string destination_root)
    : deps_(std::move(deps)), policy_(policy), destination_root_(std::move(destination_root)) {
  if (!deps_.manifest || !deps_.leases || !deps_.credentials || !deps_.store || !deps_.shutdown) {
    throw std::invalid_argument("TaskWorker: missing dependency");
  }
}

uint64_t TaskWorker::TransferOnce(const swarm::v1::Task& task, const credential::Credential& credential) {
  const auto& key = task.key();

  storage::common::ValidateDestination(destination_root_, task.destination());

  const auto metadata = deps_.store->HeadMetadata(credential, key.container(), key.object());

  const auto started = std::chrono::steady_clock::now();
  const auto bytes = deps_.store->Download(credential, key.container(), key.object(), task.destination(), metadata.size_bytes,
                                           [this] { return deps_.shutdown->IsTriggered(); });
  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);

  Metrics::Instance().AddTransferredBytes(bytes);
  Metrics::Instance().ObserveTransferDurationMs(elapsed.count());
  return bytes;
}

TaskResult TaskWorker::Execute(const swarm::v1::Task& dispatched) {
  const auto& key  = dispatched.key();
  const auto  name = model::KeyString(key);

  TaskResult result;
  state_ = WorkerState::kIdle;

  lease::Lease lease;
  try {
    lease = deps_.leases->Acquire(key);
  } catch (const util::LeaseConflict& e) {
    SWARM_LOG_DEBUG("Task leased elsewhere, skipping", {StringField("task", name), StringField("reason", e.what())});
    result.outcome = TaskOutcome::kSkipped;
    Metrics::Instance().RecordTaskOutcome(TaskOutcomeName(result.outcome));
    return result;
  }
  state_ = WorkerState::kLeaseAcquired;

  // The manifest may have moved on between query and lease.
  const auto current = deps_.manifest->Get(key);
  if (!current || current->status() != swarm::v1::TASK_STATUS_PENDING) {
    deps_.leases->Release(lease);
    state_         = WorkerState::kIdle;
    result.outcome = TaskOutcome::kSkipped;
    Metrics::Instance().RecordTaskOutcome(TaskOutcomeName(result.outcome));
    return result;
  }
  const swarm::v1::Task task = *current;

  uint32_t                 attempts     = task.attempts();
  uint32_t                 run_attempts = 0;
  swarm::v1::ErrorCategory error        = swarm::v1::ERROR_CATEGORY_NONE;
  std::string              message;

  try {
    // The budget counts every attempt the manifest has recorded, so a task
    // requeued with its history kept only gets what is left of it.
    if (policy_.ShouldRetry(attempts)) {
      state_ = WorkerState::kTransferring;
    } else {
      error   = task.last_error() == swarm::v1::ERROR_CATEGORY_NONE ? swarm::v1::ERROR_CATEGORY_UNKNOWN : task.last_error();
      message = "retry budget exhausted after " + std::to_string(attempts) + " attempts";
      state_  = WorkerState::kFailed;
    }

    for (;;) {
      const auto state = state_.load();

      if (state == WorkerState::kSucceeded || state == WorkerState::kFailed) {
        break;
      }

      if (state == WorkerState::kRetryPending) {
        const auto delay = policy_.BackoffDelay(run_attempts);
        SWARM_LOG_INFO("Retrying after backoff", {StringField("task", name), IntField("attempt", run_attempts),
                                                  IntField("delay_ms", delay.count()), StringField("error", message)});
        Metrics::Instance().RecordTaskOutcome("retry");
        if (deps_.shutdown->WaitFor(delay)) break;
        state_ = WorkerState::kTransferring;
        continue;
      }

      // kTransferring
      if (deps_.shutdown->IsTriggered()) break;

      ++attempts;
      ++run_attempts;
      ++result.transfers;
      deps_.manifest->Update(key, swarm::v1::TASK_STATUS_IN_PROGRESS, attempts);

      const auto credential = deps_.credentials->Acquire();

      try {
        result.bytes = TransferOnce(task, credential);
        error        = swarm::v1::ERROR_CATEGORY_NONE;
        message.clear();
        state_ = WorkerState::kSucceeded;
        continue;
      } catch (const util::TransferError& e) {
        error   = e.category();
        message = e.what();
      } catch (const std::filesystem::filesystem_error& e) {
        error   = swarm::v1::ERROR_CATEGORY_INVALID_DESTINATION;
        message = e.what();
      }

      if (error == swarm::v1::ERROR_CATEGORY_AUTH_EXPIRED) {
        deps_.credentials->Invalidate(credential.epoch);
      }

      if (deps_.shutdown->IsTriggered()) break;

      if (storage::IsRetryable(error) && policy_.ShouldRetry(attempts)) {
        state_ = WorkerState::kRetryPending;
      } else {
        state_ = WorkerState::kFailed;
      }
    }

    result.attempts = attempts;
    result.error    = error;
    result.message  = message;

    switch (state_.load()) {
      case WorkerState::kSucceeded:
        deps_.manifest->Update(key, swarm::v1::TASK_STATUS_COMPLETED, attempts);
        deps_.leases->Release(lease);
        result.outcome = TaskOutcome::kCompleted;
        SWARM_LOG_INFO("Task completed", {StringField("task", name), IntField("attempts", attempts),
                                          IntField("bytes", static_cast<int64_t>(result.bytes))});
        break;

      case WorkerState::kFailed:
        if (run_attempts == 0) {
          deps_.manifest->Update(key, swarm::v1::TASK_STATUS_IN_PROGRESS, attempts);
        }
        deps_.manifest->Update(key, swarm::v1::TASK_STATUS_FAILED, attempts, error, message);
        deps_.leases->Release(lease);
        result.outcome = TaskOutcome::kFailed;
        SWARM_LOG_WARN("Task failed", {StringField("task", name), IntField("attempts", attempts),
                                       StringField("category", storage::ErrorCategoryName(error)), StringField("error", message)});
        break;

      default:
        if (run_attempts == 0) {
          // Never started: the task is still pending and needs no marker.
          deps_.leases->Release(lease);
          result.outcome = TaskOutcome::kSkipped;
          break;
        }
        deps_.leases->Abandon(lease);
        result.outcome = TaskOutcome::kAbandoned;
        SWARM_LOG_WARN("Task abandoned on shutdown", {StringField("task", name), IntField("attempts", attempts)});
        break;
    }
  } catch (...) {
    SWARM_LOG_WARN("Task abandoned on run-fatal error",
                   {StringField("task", name), StringField("state", WorkerStateName(state_.load())), IntField("attempts", attempts)});
    deps_.leases->Abandon(lease);
    state_ = WorkerState::kIdle;
    throw;
  }

  Metrics::Instance().RecordTaskOutcome(TaskOutcomeName(result.outcome));
  state_ = WorkerState::kIdle;
  return result;
}

} // namespace swarm::transfer
