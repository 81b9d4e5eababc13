#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "errors.hpp"
#include "log.hpp"

struct RetryOptions {
  uint32_t max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{60000};
};

// Bounded retries with exponential backoff. Only retryable error kinds consume budget;
// terminal ones are returned after the first failure.
class RetryPolicy {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;
  using AbortCheck = std::function<bool()>;

  explicit RetryPolicy(RetryOptions options = {}, std::shared_ptr<Logger> logger = nullptr);

  // base_delay * 2^(attempt-1), capped at max_delay.
  std::chrono::milliseconds delay_for_attempt(uint32_t attempt,
                                              std::chrono::milliseconds base_delay) const;
  std::chrono::milliseconds delay_for_attempt(uint32_t attempt) const {
    return delay_for_attempt(attempt, options_.base_delay);
  }

  void set_sleeper(Sleeper sleeper);
  const RetryOptions& options() const { return options_; }

  // operation(attempt) returns a Result<T>. attempts_used receives the number of calls made.
  template<typename Operation>
  auto execute(Operation&& operation,
               uint32_t max_attempts,
               std::chrono::milliseconds base_delay,
               uint32_t* attempts_used = nullptr,
               const AbortCheck& abort = {}) const
    -> std::invoke_result_t<Operation&, uint32_t> {
    if(max_attempts == 0) max_attempts = 1;
    for(uint32_t attempt = 1; ; ++attempt) {
      auto result = operation(attempt);
      if(attempts_used) *attempts_used = attempt;
      if(result.success) return result;

      if(!result.error.retryable()) {
        log_debug(logger_.get(), "retry: terminal {} on attempt {}, not retrying",
                  to_string(result.error.kind), attempt);
        return result;
      }
      if(attempt >= max_attempts) {
        log_debug(logger_.get(), "retry: giving up after {} attempts: {}",
                  attempt, result.error.describe());
        return result;
      }
      if(abort && abort()) return result;

      auto delay = delay_for_attempt(attempt, base_delay);
      log_debug(logger_.get(), "retry: attempt {}/{} failed ({}), backing off {} ms",
                attempt, max_attempts, result.error.describe(), delay.count());
      sleeper_(delay);
      if(abort && abort()) return result;
    }
  }

  template<typename Operation>
  auto execute(Operation&& operation) const -> std::invoke_result_t<Operation&, uint32_t> {
    return execute(std::forward<Operation>(operation), options_.max_attempts, options_.base_delay);
  }

private:
  RetryOptions options_;
  std::shared_ptr<Logger> logger_;
  Sleeper sleeper_;
};
