#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/transfer/retry_policy.hpp"
#include "internal/transfer/task_worker.hpp"

namespace swarm::scheduler {

struct RunOptions {
  uint32_t max_workers    = 4;
  bool     include_failed = false;
  bool     dry_run        = false;

  swarm::runtime::config::RequeuePolicy requeue_policy    = swarm::runtime::config::REQUEUE_POLICY_RESET_ATTEMPTS;
  std::chrono::milliseconds             progress_interval = std::chrono::seconds(10);
};

struct RunSummary {
  uint64_t eligible  = 0;
  uint64_t completed = 0;
  uint64_t failed    = 0;
  uint64_t skipped   = 0;
  uint64_t abandoned = 0;
  uint64_t transfers = 0;
  uint64_t bytes     = 0;

  // in_progress tasks left ineligible because a lease marker exists
  uint64_t blocked = 0;
};

/*
  Bounded-concurrency dispatcher.

  Run() recovers orphaned in_progress tasks, requeues failed tasks when
  asked, then drains the eligible set through up to max_workers
  TaskWorkers. It returns when the set is exhausted and every worker is
  idle, or after a shutdown.

  A run-fatal error (credential renewal rejected, manifest write failure)
  stops dispatch, trips the shutdown signal so in-flight work is
  abandoned, flushes the manifest and is rethrown from Run().
*/
class Scheduler {
 public:
  Scheduler(transfer::WorkerDependencies deps, transfer::RetryPolicy policy, std::string destination_root);

  RunSummary Run(const RunOptions& options);

 private:
  // Returns the number of tasks blocked by a lease marker.
  uint64_t PrepareManifest(const RunOptions& options);

  std::vector<swarm::v1::Task> EligibleTasks(const RunOptions& options) const;

  // False for a failed task whose preserved attempts already fill the budget.
  bool Requeueable(const swarm::v1::Task& task, const RunOptions& options) const;

  void Record(const transfer::TaskResult& result);
  void RecordFatal(std::exception_ptr error);
  void LogProgress(size_t active, size_t queued) const;

  transfer::WorkerDependencies deps_;
  transfer::RetryPolicy        policy_;
  std::string                  destination_root_;

  mutable std::mutex mutex_;
  RunSummary         summary_;
  std::exception_ptr fatal_;
};

} // namespace swarm::scheduler
