#pragma once

#include <chrono>
#include <cstdint>

#include "config/config.pb.h"

namespace swarm::transfer {

/*
  Per-task retry budget and exponential backoff.

  `attempt` is 1-based: the delay after the first failed attempt is
  base_delay, then 2x, 4x, ... capped at max_delay.
*/
class RetryPolicy {
 public:
  RetryPolicy(uint32_t max_retries, std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay);

  static RetryPolicy FromConfig(const swarm::runtime::config::TransferConfig& config);

  std::chrono::milliseconds BackoffDelay(uint32_t attempt) const;

  // True while another attempt fits in the budget of max_retries + 1.
  bool ShouldRetry(uint32_t attempts_made) const {
    return attempts_made <= max_retries_;
  }

  uint32_t max_retries() const {
    return max_retries_;
  }

 private:
  uint32_t                  max_retries_;
  std::chrono::milliseconds base_delay_;
  std::chrono::milliseconds max_delay_;
};

} // namespace swarm::transfer
