#include "shutdown_signal.hpp"

#include <csignal>

#include "internal/observability/logging.hpp"

namespace swarm::runtime {

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void HandleSignal(int signum) {
  g_signal_received = signum;
}

} // namespace

void ShutdownSignal::Trigger() {
  {
    std::lock_guard lock(mutex_);
    if (triggered_.exchange(true)) return;
  }
  cv_.notify_all();
}

bool ShutdownSignal::IsTriggered() const {
  return triggered_.load();
}

bool ShutdownSignal::WaitFor(std::chrono::milliseconds duration) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, duration, [&] { return triggered_.load(); });
}

void ShutdownSignal::InstallHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

bool ShutdownSignal::PollSignals() {
  if (g_signal_received != 0 && !IsTriggered()) {
    SWARM_LOG_WARN("Shutdown requested, finishing current attempts", {observability::IntField("signal", g_signal_received)});
    Trigger();
  }
  return IsTriggered();
}

} // namespace swarm::runtime
