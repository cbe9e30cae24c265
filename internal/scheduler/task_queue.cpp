#include "task_queue.hpp"

namespace swarm::scheduler {

void TaskQueue::Enqueue(const swarm::v1::Task& task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<swarm::v1::Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  swarm::v1::Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

size_t TaskQueue::Shutdown() {
  size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    dropped = queue_.size();
    std::queue<swarm::v1::Task>().swap(queue_);
  }
  cv_.notify_all();
  return dropped;
}

size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace swarm::scheduler
