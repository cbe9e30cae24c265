#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/credential/credential_coordinator.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/runtime/shutdown_signal.hpp"
#include "internal/storage/object_store.hpp"
#include "retry_policy.hpp"

namespace swarm::transfer {

/*
  Per-task state machine:

      Idle ─▶ LeaseAcquired ─▶ Transferring ─▶ Succeeded
                                 ▲      │
                                 │      ├──▶ RetryPending ─┐
                                 └──────┼──────────────────┘
                                        └──▶ Failed

  The lease is held from LeaseAcquired until Succeeded or Failed. A
  shutdown observed before or between attempts abandons the task: it
  stays in_progress and its lease marker stays on disk.
*/
enum class WorkerState {
  kIdle,
  kLeaseAcquired,
  kTransferring,
  kRetryPending,
  kSucceeded,
  kFailed,
};

enum class TaskOutcome {
  kCompleted,
  kFailed,
  kSkipped,
  kAbandoned,
};

const char* WorkerStateName(WorkerState state);
const char* TaskOutcomeName(TaskOutcome outcome);

struct TaskResult {
  TaskOutcome              outcome   = TaskOutcome::kSkipped;
  uint32_t                 attempts  = 0;
  uint32_t                 transfers = 0;
  uint64_t                 bytes     = 0;
  swarm::v1::ErrorCategory error     = swarm::v1::ERROR_CATEGORY_NONE;
  std::string              message;
};

struct WorkerDependencies {
  std::shared_ptr<manifest::ManifestStore>          manifest;
  std::shared_ptr<lease::LeaseManager>              leases;
  std::shared_ptr<credential::CredentialCoordinator> credentials;
  storage::ObjectStorePtr                           store;
  std::shared_ptr<runtime::ShutdownSignal>          shutdown;
};

class TaskWorker {
 public:
  TaskWorker(WorkerDependencies deps, RetryPolicy policy, std::string destination_root);

  // Runs one task to a terminal state. Task-level failures are recorded in
  // the manifest and returned; util::AuthRefreshError and manifest write
  // failures propagate after the lease is abandoned.
  TaskResult Execute(const swarm::v1::Task& task);

  WorkerState state() const {
    return state_.load();
  }

 private:
  uint64_t TransferOnce(const swarm::v1::Task& task, const credential::Credential& credential);

  WorkerDependencies       deps_;
  RetryPolicy              policy_;
  std::string              destination_root_;
  std::atomic<WorkerState> state_{WorkerState::kIdle};
};

} // namespace swarm::transfer
