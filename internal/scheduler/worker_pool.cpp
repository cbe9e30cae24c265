#include "worker_pool.hpp"

#include <stdexcept>

namespace swarm::scheduler {

WorkerPool::WorkerPool(std::shared_ptr<TaskQueue> queue, size_t workers, Handler handler)
    : queue_(std::move(queue)), workers_(workers), handler_(std::move(handler)) {
  if (!queue_ || !handler_) {
    throw std::invalid_argument("WorkerPool: queue and handler are required");
  }
  if (workers_ == 0) {
    throw std::invalid_argument("WorkerPool: at least one worker is required");
  }
}

WorkerPool::~WorkerPool() {
  queue_->Shutdown();
  Join();
}

void WorkerPool::Start() {
  threads_.reserve(workers_);
  for (size_t i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this, i);
  }
}

bool WorkerPool::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return exited_ == threads_.size(); });
}

void WorkerPool::Join() {
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void WorkerPool::Run(size_t worker_index) {
  while (auto task = queue_->Dequeue()) {
    ++active_;
    handler_(worker_index, *task);
    --active_;
  }

  {
    std::lock_guard lock(mutex_);
    ++exited_;
  }
  cv_.notify_all();
}

} // namespace swarm::scheduler
