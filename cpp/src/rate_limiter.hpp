#pragma once

#include "context.hpp"
#include "error.hpp"
#include <chrono>
#include <mutex>

namespace siphon {

class RateLimiter {
public:
  virtual ~RateLimiter() = default;

  // Blocks until a token is available. Fails only when ctx is cancelled.
  virtual MaybeError wait(const Context& ctx) = 0;
};

// Token bucket: `requests` tokens per `interval`, at most `burst` tokens
// banked. The bucket starts full. Callers reserve a token up front and sleep
// until it matures, so concurrent waiters are served in arrival order.
class TokenBucket : public RateLimiter {
public:
  // Throws std::invalid_argument if the configuration is rejected by
  // check_rate_limit().
  TokenBucket(int requests, std::chrono::milliseconds interval, int burst = 1);

  MaybeError wait(const Context& ctx) override;

  double tokens_per_second() const { return rate_; }
  int burst() const { return burst_; }

private:
  void refill_locked(std::chrono::steady_clock::time_point now);

  double rate_;
  int burst_;

  std::mutex mutex_;
  double tokens_;
  std::chrono::steady_clock::time_point last_;
};

// Rejects non-positive requests or interval and negative burst.
MaybeError check_rate_limit(int requests, std::chrono::milliseconds interval, int burst);

}  // namespace siphon
