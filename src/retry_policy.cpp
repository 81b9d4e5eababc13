#include "retry_policy.hpp"

#include <algorithm>
#include <thread>

RetryPolicy::RetryPolicy(RetryOptions options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(std::move(logger)),
    sleeper_([](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); }) {
  if(options_.max_attempts == 0) options_.max_attempts = 1;
  if(options_.max_delay < options_.base_delay) options_.max_delay = options_.base_delay;
}

std::chrono::milliseconds RetryPolicy::delay_for_attempt(uint32_t attempt,
                                                         std::chrono::milliseconds base_delay) const {
  if(attempt == 0) attempt = 1;
  if(base_delay.count() <= 0) return std::chrono::milliseconds(0);
  const auto cap = std::max(options_.max_delay, base_delay);
  // stop doubling once the cap is reached so large attempt numbers cannot overflow
  auto delay = base_delay;
  for(uint32_t i = 1; i < attempt; ++i) {
    if(delay >= cap / 2) return cap;
    delay *= 2;
  }
  return std::min(delay, cap);
}

void RetryPolicy::set_sleeper(Sleeper sleeper) {
  if(sleeper) sleeper_ = std::move(sleeper);
}
