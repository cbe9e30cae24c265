#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "swarm/v1/manifest.pb.h"

namespace swarm::scheduler {

/*
  Thread-safe blocking queue of dispatchable tasks.

  Close() lets workers drain what is left; Shutdown() drops it.
*/
class TaskQueue {
 public:
  void Enqueue(const swarm::v1::Task& task);

  // blocking wait; nullopt once closed and empty, or shut down
  std::optional<swarm::v1::Task> Dequeue();

  void Close();

  // Returns the number of tasks dropped.
  size_t Shutdown();

  size_t Size() const;

 private:
  mutable std::mutex            mutex_;
  std::condition_variable       cv_;
  std::queue<swarm::v1::Task>   queue_;
  bool                          closed_ = false;
};

} // namespace swarm::scheduler
