#include "rate_limiter.hpp"
#include <algorithm>
#include <stdexcept>

namespace siphon {

MaybeError check_rate_limit(int requests, std::chrono::milliseconds interval, int burst) {
  if (requests <= 0)
    return Error{ErrorCode::InvalidRateLimit,
                 "invalid rate limit configuration: requests must be positive"};
  if (interval.count() <= 0)
    return Error{ErrorCode::InvalidRateLimit,
                 "invalid rate limit configuration: interval must be positive"};
  if (burst < 0)
    return Error{ErrorCode::InvalidRateLimit,
                 "invalid rate limit configuration: burst must not be negative"};
  return std::nullopt;
}

TokenBucket::TokenBucket(int requests, std::chrono::milliseconds interval, int burst) {
  if (auto err = check_rate_limit(requests, interval, burst))
    throw std::invalid_argument(err->message);
  rate_ = static_cast<double>(requests) * 1000.0 / static_cast<double>(interval.count());
  // A zero burst would never admit anything.
  burst_ = std::max(burst, 1);
  tokens_ = burst_;
  last_ = std::chrono::steady_clock::now();
}

void TokenBucket::refill_locked(std::chrono::steady_clock::time_point now) {
  if (now <= last_) return;
  std::chrono::duration<double> elapsed = now - last_;
  tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed.count() * rate_);
  last_ = now;
}

MaybeError TokenBucket::wait(const Context& ctx) {
  if (auto err = ctx.err()) return err;

  std::chrono::steady_clock::time_point ready;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    auto now = std::chrono::steady_clock::now();
    refill_locked(now);
    tokens_ -= 1.0;
    if (tokens_ >= 0.0) return std::nullopt;
    std::chrono::duration<double> delay(-tokens_ / rate_);
    ready = now + std::chrono::ceil<std::chrono::steady_clock::duration>(delay);
  }

  if (ctx.sleep_until(ready)) return std::nullopt;

  // Hand the reservation back so later waiters are not delayed by it.
  {
    std::lock_guard<std::mutex> lk(mutex_);
    refill_locked(std::chrono::steady_clock::now());
    tokens_ = std::min(static_cast<double>(burst_), tokens_ + 1.0);
  }
  return Error{ErrorCode::Cancelled, "rate limiter wait: context canceled"};
}

}  // namespace siphon
