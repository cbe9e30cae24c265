#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace swarm::runtime {

/*
  Process-wide stop flag.

  Trigger() is safe from any thread. Signal handlers must not take locks,
  so they only set the async flag; the scheduler polls PollSignals() to
  promote it into a full trigger that wakes sleepers.
*/
class ShutdownSignal {
 public:
  void Trigger();
  bool IsTriggered() const;

  // Sleeps for `duration` or until triggered. Returns true if triggered.
  bool WaitFor(std::chrono::milliseconds duration);

  // Routes SIGINT and SIGTERM to this signal.
  void InstallHandlers();

  // Promotes a delivered SIGINT/SIGTERM into Trigger().
  bool PollSignals();

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       triggered_{false};
};

} // namespace swarm::runtime
