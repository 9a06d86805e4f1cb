#pragma once

#include "context.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace siphon {

// Worker count for a pool when none is configured: one per available core.
inline std::size_t default_workers() {
  unsigned n = std::thread::hardware_concurrency();
  return n > 0 ? n : 1;
}

enum class RecvStatus { Value, Closed, Cancelled };

// Bounded multi-producer multi-consumer queue. Closing wakes every waiter;
// receivers drain buffered items before they observe Closed.
template <typename T>
class Channel {
public:
  explicit Channel(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  // Blocks while full. Returns false if the channel is closed.
  bool send(T item) {
    std::unique_lock<std::mutex> lk(mutex_);
    not_full_.wait(lk, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  // Returns true for the call that actually closed the channel.
  bool close() {
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (closed_) return false;
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    return true;
  }

  RecvStatus recv(T& out) {
    std::unique_lock<std::mutex> lk(mutex_);
    not_empty_.wait(lk, [this] { return closed_ || !items_.empty(); });
    return pop_locked(out);
  }

  // Races the channel against ctx. Cancellation is reported even if items
  // are buffered.
  RecvStatus recv(const Context& ctx, T& out) {
    ListenerGuard wake(ctx, [this] {
      std::lock_guard<std::mutex> lk(mutex_);
      not_empty_.notify_all();
    });
    std::unique_lock<std::mutex> lk(mutex_);
    not_empty_.wait(lk, [&] { return ctx.done() || closed_ || !items_.empty(); });
    if (ctx.done()) return RecvStatus::Cancelled;
    return pop_locked(out);
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_.size();
  }

private:
  RecvStatus pop_locked(T& out) {
    if (items_.empty()) return RecvStatus::Closed;
    out = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return RecvStatus::Value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
};

// Counts worker exits and runs on_complete exactly once, on the thread of the
// last arrival. Used to close a pool's output channel after every worker is
// done with it.
class CompletionBarrier {
public:
  CompletionBarrier(std::size_t parties, std::function<void()> on_complete)
    : remaining_(parties), on_complete_(std::move(on_complete)) {
    if (parties == 0) fire();
  }

  void arrive() {
    bool last = false;
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (remaining_ == 0) return;
      last = --remaining_ == 0;
    }
    if (last) fire();
  }

  void wait() {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this] { return completed_; });
  }

  bool completed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return completed_;
  }

private:
  void fire() {
    if (on_complete_) on_complete_();
    {
      std::lock_guard<std::mutex> lk(mutex_);
      completed_ = true;
    }
    cv_.notify_all();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t remaining_;
  bool completed_ = false;
  std::function<void()> on_complete_;
};

}  // namespace siphon
