#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "swarm/v1/manifest.pb.h"

namespace swarm::manifest {

struct ManifestStats {
  uint64_t pending     = 0;
  uint64_t in_progress = 0;
  uint64_t completed   = 0;
  uint64_t failed      = 0;

  uint64_t total_bytes     = 0;
  uint64_t completed_bytes = 0;

  uint64_t total() const {
    return pending + in_progress + completed + failed;
  }
};

/*
  Durable record of every transfer task.

  All mutation goes through this object and is serialized by one mutex;
  workers never edit tasks in place. Terminal transitions (completed,
  failed) are persisted once `flush_every_transitions` of them have
  accumulated, so a crash loses at most that many recent transitions.

  Persist snapshots state under the writer lock and writes outside it; a
  generation counter keeps an older snapshot from overwriting a newer one.
*/
class ManifestStore {
 public:
  struct Options {
    std::string path;
    uint32_t    flush_every_transitions = 1;
  };

  explicit ManifestStore(Options options);

  ManifestStore(const ManifestStore&)            = delete;
  ManifestStore& operator=(const ManifestStore&) = delete;

  // Loads the manifest file if it exists, otherwise starts empty.
  // Throws util::ManifestCorruptError.
  void Open();

  // Reads the persisted manifest and replaces the in-memory state with it.
  swarm::v1::Manifest Load();

  // Writes the full current state (write-to-temp-then-replace).
  void Persist();

  // Persists only if something changed since the last persist.
  void Flush();

  // Insertion order, which is stable across persist/load.
  std::vector<swarm::v1::Task> Query(const std::set<swarm::v1::TaskStatus>& statuses) const;

  std::optional<swarm::v1::Task> Get(const swarm::v1::TaskKey& key) const;

  // Only the lease holder for `key` may call this. Throws util::NotFound,
  // util::InvalidState on an illegal transition.
  void Update(const swarm::v1::TaskKey& key, swarm::v1::TaskStatus status, uint32_t attempts,
              swarm::v1::ErrorCategory error = swarm::v1::ERROR_CATEGORY_NONE, const std::string& error_message = {});

  // Generation pass insert. Returns false if the key already exists; the
  // existing task is left untouched.
  bool AddTask(swarm::v1::Task task);

  // failed -> pending (retry mode).
  void Requeue(const swarm::v1::TaskKey& key, swarm::runtime::config::RequeuePolicy policy);

  // in_progress -> pending for a task whose owner is gone and whose lease
  // marker has been cleared.
  void Recover(const swarm::v1::TaskKey& key);

  ManifestStats Stats() const;

  size_t Size() const;

  const std::string& path() const {
    return options_.path;
  }

 private:
  swarm::v1::Task& MutableTaskLocked(const swarm::v1::TaskKey& key);
  void             TransitionLocked(swarm::v1::Task& task, swarm::v1::TaskStatus to);
  void             AdoptLocked(swarm::v1::Manifest manifest);
  void             PersistIfDue(bool due);

  Options options_;

  mutable std::mutex                      mutex_;
  std::vector<swarm::v1::Task>            tasks_;
  std::unordered_map<std::string, size_t> index_;
  uint64_t                                generation_         = 0;
  uint32_t                                unflushed_terminal_ = 0;

  std::mutex persist_mutex_;
  uint64_t   persisted_generation_ = 0;
};

} // namespace swarm::manifest
