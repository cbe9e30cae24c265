#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace swarm::scheduler {

/*
  Fixed set of threads draining one TaskQueue.

  The handler must not throw; each thread exits once the queue reports
  no more work.
*/
class WorkerPool {
 public:
  using Handler = std::function<void(size_t worker_index, const swarm::v1::Task& task)>;

  WorkerPool(std::shared_ptr<TaskQueue> queue, size_t workers, Handler handler);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Returns true once every worker thread has exited.
  bool WaitFor(std::chrono::milliseconds timeout);

  void Join();

  // Workers currently inside the handler.
  size_t active() const {
    return active_.load();
  }

 private:
  void Run(size_t worker_index);

  std::shared_ptr<TaskQueue> queue_;
  size_t                     workers_;
  Handler                    handler_;

  std::vector<std::thread> threads_;
  std::atomic<size_t>      active_{0};

  std::mutex              mutex_;
  std::condition_variable cv_;
  size_t                  exited_ = 0;
};

} // namespace swarm::scheduler
