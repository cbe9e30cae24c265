#include "retry_policy.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace swarm::transfer {

RetryPolicy::RetryPolicy(uint32_t max_retries, std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay)
    : max_retries_(max_retries), base_delay_(base_delay), max_delay_(std::max(max_delay, base_delay)) {
}

RetryPolicy RetryPolicy::FromConfig(const swarm::runtime::config::TransferConfig& config) {
  return RetryPolicy(config.max_retries(), util::ToMillis(config.base_delay()), util::ToMillis(config.max_delay()));
}

std::chrono::milliseconds RetryPolicy::BackoffDelay(uint32_t attempt) const {
  if (attempt == 0 || base_delay_.count() <= 0) return std::chrono::milliseconds::zero();

  auto delay = base_delay_;
  for (uint32_t i = 1; i < attempt; ++i) {
    if (delay >= max_delay_ / 2) return max_delay_;
    delay *= 2;
  }
  return std::min(delay, max_delay_);
}

} // namespace swarm::transfer
