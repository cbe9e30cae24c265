#include "scheduler.hpp"

#include <algorithm>
#include <set>

#include "internal/model/task_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/units.hpp"
#include "task_queue.hpp"
#include "worker_pool.hpp"

namespace swarm::scheduler {

using namespace swarm::observability;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(200);

} // namespace

Scheduler::Scheduler(transfer::WorkerDependencies deps, transfer::RetryPolicy policy, std::string destination_root)
    : deps_(std::move(deps)), policy_(policy), destination_root_(std::move(destination_root)) {
  if (!deps_.manifest || !deps_.leases || !deps_.shutdown) {
    throw std::invalid_argument("Scheduler: missing dependency");
  }
}

uint64_t Scheduler::PrepareManifest(const RunOptions& options) {
  uint64_t blocked = 0;

  for (const auto& task : deps_.manifest->Query({swarm::v1::TASK_STATUS_IN_PROGRESS})) {
    if (deps_.leases->HasMarker(task.key())) {
      ++blocked;
      SWARM_LOG_WARN("Task in progress under an existing lease marker, not eligible",
                     {StringField("task", model::KeyString(task.key()))});
      continue;
    }
    if (!options.dry_run) {
      deps_.manifest->Recover(task.key());
      SWARM_LOG_INFO("Recovered orphaned task", {StringField("task", model::KeyString(task.key()))});
    }
  }

  if (options.include_failed && !options.dry_run) {
    uint64_t exhausted = 0;
    for (const auto& task : deps_.manifest->Query({swarm::v1::TASK_STATUS_FAILED})) {
      if (!Requeueable(task, options)) {
        ++exhausted;
        continue;
      }
      deps_.manifest->Requeue(task.key(), options.requeue_policy);
    }
    if (exhausted > 0) {
      SWARM_LOG_WARN("Failed tasks with no retry budget left were not requeued",
                     {IntField("tasks", static_cast<int64_t>(exhausted)), IntField("max_retries", policy_.max_retries())});
    }
  }
  return blocked;
}

bool Scheduler::Requeueable(const swarm::v1::Task& task, const RunOptions& options) const {
  if (options.requeue_policy != swarm::runtime::config::REQUEUE_POLICY_PRESERVE_ATTEMPTS) {
    return true;
  }
  return policy_.ShouldRetry(task.attempts());
}

std::vector<swarm::v1::Task> Scheduler::EligibleTasks(const RunOptions& options) const {
  std::set<swarm::v1::TaskStatus> statuses{swarm::v1::TASK_STATUS_PENDING};
  if (options.dry_run) {
    // Nothing was recovered or requeued; count what would have been.
    if (options.include_failed) statuses.insert(swarm::v1::TASK_STATUS_FAILED);
    statuses.insert(swarm::v1::TASK_STATUS_IN_PROGRESS);
  }

  std::vector<swarm::v1::Task> eligible;
  for (auto& task : deps_.manifest->Query(statuses)) {
    if (task.status() == swarm::v1::TASK_STATUS_IN_PROGRESS && deps_.leases->HasMarker(task.key())) continue;
    if (task.status() == swarm::v1::TASK_STATUS_FAILED && !Requeueable(task, options)) continue;
    eligible.push_back(std::move(task));
  }
  return eligible;
}

void Scheduler::Record(const transfer::TaskResult& result) {
  std::lock_guard lock(mutex_);
  summary_.transfers += result.transfers;
  summary_.bytes += result.bytes;
  switch (result.outcome) {
    case transfer::TaskOutcome::kCompleted:
      ++summary_.completed;
      break;
    case transfer::TaskOutcome::kFailed:
      ++summary_.failed;
      break;
    case transfer::TaskOutcome::kSkipped:
      ++summary_.skipped;
      break;
    case transfer::TaskOutcome::kAbandoned:
      ++summary_.abandoned;
      break;
  }
}

void Scheduler::RecordFatal(std::exception_ptr error) {
  std::lock_guard lock(mutex_);
  if (!fatal_) fatal_ = error;
}

void Scheduler::LogProgress(size_t active, size_t queued) const {
  const auto stats = deps_.manifest->Stats();
  SWARM_LOG_INFO("Progress", {IntField("completed", static_cast<int64_t>(stats.completed)),
                              IntField("failed", static_cast<int64_t>(stats.failed)),
                              IntField("pending", static_cast<int64_t>(stats.pending)),
                              IntField("in_progress", static_cast<int64_t>(stats.in_progress)),
                              IntField("active_workers", static_cast<int64_t>(active)),
                              IntField("queued", static_cast<int64_t>(queued)),
                              StringField("downloaded", util::FormatSize(stats.completed_bytes)),
                              StringField("total", util::FormatSize(stats.total_bytes))});
}

RunSummary Scheduler::Run(const RunOptions& options) {
  {
    std::lock_guard lock(mutex_);
    summary_ = RunSummary{};
    fatal_   = nullptr;
  }

  const auto blocked  = PrepareManifest(options);
  auto       eligible = EligibleTasks(options);

  {
    std::lock_guard lock(mutex_);
    summary_.eligible = eligible.size();
    summary_.blocked  = blocked;
  }

  if (options.dry_run) {
    uint64_t bytes = 0;
    for (const auto& task : eligible) bytes += task.size_bytes();
    SWARM_LOG_INFO("Dry run", {IntField("would_transfer", static_cast<int64_t>(eligible.size())),
                               StringField("size", util::FormatSize(bytes)), IntField("blocked", static_cast<int64_t>(blocked))});
    std::lock_guard lock(mutex_);
    return summary_;
  }

  if (eligible.empty()) {
    SWARM_LOG_INFO("Nothing to transfer", {IntField("blocked", static_cast<int64_t>(blocked))});
    deps_.manifest->Flush();
    std::lock_guard lock(mutex_);
    return summary_;
  }

  const size_t workers = std::clamp<size_t>(options.max_workers, 1, eligible.size());

  auto queue = std::make_shared<TaskQueue>();
  for (const auto& task : eligible) queue->Enqueue(task);
  queue->Close();

  std::vector<std::unique_ptr<transfer::TaskWorker>> task_workers;
  task_workers.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    task_workers.push_back(std::make_unique<transfer::TaskWorker>(deps_, policy_, destination_root_));
  }

  SWARM_LOG_INFO("Starting transfer", {IntField("tasks", static_cast<int64_t>(eligible.size())),
                                       IntField("workers", static_cast<int64_t>(workers))});

  WorkerPool pool(queue, workers, [&](size_t index, const swarm::v1::Task& task) {
    if (deps_.shutdown->IsTriggered()) return;
    try {
      Record(task_workers[index]->Execute(task));
    } catch (const std::exception& e) {
      SWARM_LOG_ERROR("Run aborted", {StringField("task", model::KeyString(task.key())), StringField("error", e.what())});
      RecordFatal(std::current_exception());
      queue->Shutdown();
      deps_.shutdown->Trigger();
    }
  });
  pool.Start();

  auto last_progress = std::chrono::steady_clock::now();
  while (!pool.WaitFor(kPollInterval)) {
    if (deps_.shutdown->PollSignals()) {
      const auto dropped = queue->Shutdown();
      if (dropped > 0) {
        SWARM_LOG_INFO("Dispatch stopped", {IntField("undispatched", static_cast<int64_t>(dropped))});
      }
    }
    const auto now = std::chrono::steady_clock::now();
    if (options.progress_interval.count() > 0 && now - last_progress >= options.progress_interval) {
      LogProgress(pool.active(), queue->Size());
      last_progress = now;
    }
  }
  pool.Join();

  deps_.manifest->Flush();

  std::lock_guard lock(mutex_);
  if (fatal_) std::rethrow_exception(fatal_);

  SWARM_LOG_INFO("Run finished", {IntField("completed", static_cast<int64_t>(summary_.completed)),
                                  IntField("failed", static_cast<int64_t>(summary_.failed)),
                                  IntField("skipped", static_cast<int64_t>(summary_.skipped)),
                                  IntField("abandoned", static_cast<int64_t>(summary_.abandoned)),
                                  StringField("downloaded", util::FormatSize(summary_.bytes))});
  return summary_;
}

} // namespace swarm::scheduler
