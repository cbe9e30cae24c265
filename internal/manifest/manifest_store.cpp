#include "manifest_store.hpp"

#include <filesystem>

#include "internal/manifest/manifest_codec.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/task_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace swarm::manifest {

using swarm::v1::Manifest;
using swarm::v1::Task;
using swarm::v1::TaskKey;
using swarm::v1::TaskStatus;

ManifestStore::ManifestStore(Options options) : options_(std::move(options)) {
  if (options_.flush_every_transitions == 0) {
    options_.flush_every_transitions = 1;
  }
}

void ManifestStore::Open() {
  if (!std::filesystem::exists(options_.path)) {
    SWARM_LOG_INFO("Created new manifest", {observability::StringField("path", options_.path)});
    return;
  }

  auto manifest = Load();
  SWARM_LOG_INFO("Loaded existing manifest",
                 {observability::StringField("path", options_.path), observability::IntField("tasks", manifest.tasks_size())});
}

Manifest ManifestStore::Load() {
  auto manifest = ReadManifestFile(options_.path);

  std::lock_guard lock(mutex_);
  AdoptLocked(manifest);
  return manifest;
}

void ManifestStore::AdoptLocked(Manifest manifest) {
  std::vector<Task>                       tasks;
  std::unordered_map<std::string, size_t> index;
  tasks.reserve(static_cast<size_t>(manifest.tasks_size()));

  for (auto& task : *manifest.mutable_tasks()) {
    const auto key = model::KeyString(task.key());
    if (!index.emplace(key, tasks.size()).second) {
      throw util::ManifestCorruptError("duplicate task key in manifest: " + key);
    }
    tasks.push_back(std::move(task));
  }

  tasks_              = std::move(tasks);
  index_              = std::move(index);
  unflushed_terminal_ = 0;
  ++generation_;

  std::lock_guard persist_lock(persist_mutex_);
  persisted_generation_ = generation_;
}

void ManifestStore::Persist() {
  Manifest snapshot;
  uint64_t generation = 0;
  {
    std::lock_guard lock(mutex_);
    snapshot.set_format_version(kManifestFormatVersion);
    snapshot.set_task_count(tasks_.size());
    *snapshot.mutable_written_at() = util::ToProto(util::Now());
    for (const auto& task : tasks_) {
      *snapshot.add_tasks() = task;
    }
    generation          = generation_;
    unflushed_terminal_ = 0;
  }

  std::lock_guard persist_lock(persist_mutex_);
  if (generation < persisted_generation_) {
    return;
  }
  WriteManifestFileAtomic(options_.path, snapshot);
  persisted_generation_ = generation;
}

void ManifestStore::Flush() {
  {
    std::lock_guard lock(mutex_);
    std::lock_guard persist_lock(persist_mutex_);
    if (generation_ == persisted_generation_ && std::filesystem::exists(options_.path)) {
      return;
    }
  }
  Persist();
}

void ManifestStore::PersistIfDue(bool due) {
  if (due) {
    Persist();
  }
}

std::vector<Task> ManifestStore::Query(const std::set<TaskStatus>& statuses) const {
  std::lock_guard lock(mutex_);

  std::vector<Task> result;
  for (const auto& task : tasks_) {
    if (statuses.count(task.status())) {
      result.push_back(task);
    }
  }
  return result;
}

std::optional<Task> ManifestStore::Get(const TaskKey& key) const {
  std::lock_guard lock(mutex_);

  auto it = index_.find(model::KeyString(key));
  if (it == index_.end()) return std::nullopt;
  return tasks_[it->second];
}

Task& ManifestStore::MutableTaskLocked(const TaskKey& key) {
  const auto flat = model::KeyString(key);
  auto       it   = index_.find(flat);
  if (it == index_.end()) {
    throw util::NotFound("task not in manifest: " + flat);
  }
  return tasks_[it->second];
}

void ManifestStore::TransitionLocked(Task& task, TaskStatus to) {
  if (!model::CanTransition(task.status(), to)) {
    throw util::InvalidState("illegal task transition " + std::string(model::StatusName(task.status())) + " -> " + model::StatusName(to) +
                             " for " + model::KeyString(task.key()));
  }
  task.set_status(to);
  *task.mutable_updated_at() = util::ToProto(util::Now());
  ++generation_;
}

void ManifestStore::Update(const TaskKey& key, TaskStatus status, uint32_t attempts, swarm::v1::ErrorCategory error,
                           const std::string& error_message) {
  bool due = false;
  {
    std::lock_guard lock(mutex_);

    auto& task = MutableTaskLocked(key);
    TransitionLocked(task, status);
    task.set_attempts(attempts);
    task.set_last_error(error);
    if (error == swarm::v1::ERROR_CATEGORY_NONE) {
      task.clear_last_error_message();
    } else {
      task.set_last_error_message(error_message);
    }

    if (model::IsTerminal(status)) {
      ++unflushed_terminal_;
      due = unflushed_terminal_ >= options_.flush_every_transitions;
    }
  }
  PersistIfDue(due);
}

bool ManifestStore::AddTask(Task task) {
  std::lock_guard lock(mutex_);

  const auto flat = model::KeyString(task.key());
  if (index_.count(flat)) {
    return false;
  }

  task.set_status(swarm::v1::TASK_STATUS_PENDING);
  task.set_attempts(0);
  task.set_last_error(swarm::v1::ERROR_CATEGORY_NONE);
  task.clear_last_error_message();
  const auto now             = util::ToProto(util::Now());
  *task.mutable_added_at()   = now;
  *task.mutable_updated_at() = now;

  index_.emplace(flat, tasks_.size());
  tasks_.push_back(std::move(task));
  ++generation_;
  return true;
}

void ManifestStore::Requeue(const TaskKey& key, swarm::runtime::config::RequeuePolicy policy) {
  std::lock_guard lock(mutex_);

  auto& task = MutableTaskLocked(key);
  if (task.status() != swarm::v1::TASK_STATUS_FAILED) {
    throw util::InvalidState("only failed tasks can be requeued: " + model::KeyString(key));
  }
  TransitionLocked(task, swarm::v1::TASK_STATUS_PENDING);
  if (policy != swarm::runtime::config::REQUEUE_POLICY_PRESERVE_ATTEMPTS) {
    task.set_attempts(0);
  }
}

void ManifestStore::Recover(const TaskKey& key) {
  std::lock_guard lock(mutex_);

  auto& task = MutableTaskLocked(key);
  if (task.status() != swarm::v1::TASK_STATUS_IN_PROGRESS) {
    throw util::InvalidState("only in-progress tasks can be recovered: " + model::KeyString(key));
  }
  TransitionLocked(task, swarm::v1::TASK_STATUS_PENDING);
}

ManifestStats ManifestStore::Stats() const {
  std::lock_guard lock(mutex_);

  ManifestStats stats;
  for (const auto& task : tasks_) {
    stats.total_bytes += task.size_bytes();
    switch (task.status()) {
      case swarm::v1::TASK_STATUS_PENDING:
        ++stats.pending;
        break;
      case swarm::v1::TASK_STATUS_IN_PROGRESS:
        ++stats.in_progress;
        break;
      case swarm::v1::TASK_STATUS_COMPLETED:
        ++stats.completed;
        stats.completed_bytes += task.size_bytes();
        break;
      case swarm::v1::TASK_STATUS_FAILED:
        ++stats.failed;
        break;
      default:
        break;
    }
  }
  return stats;
}

size_t ManifestStore::Size() const {
  std::lock_guard lock(mutex_);
  return tasks_.size();
}

} // namespace swarm::manifest
