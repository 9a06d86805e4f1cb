#pragma once

#include "error.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace siphon {

// Cancellation signal shared between a caller and the work it starts.
// Copies share the same state. Listeners run once, on the cancelling thread,
// and are used to wake waits that block on their own condition variables.
class Context {
public:
  Context();

  void cancel();
  bool done() const;
  // Cancelled error once done(), nothing before.
  MaybeError err() const;

  // Returns a context that is cancelled when this one is. Cancelling the
  // child does not affect the parent. A child stops listening to its parent
  // once it is cancelled or its last copy is gone.
  Context child() const;

  // If already cancelled, fn runs immediately and 0 is returned.
  uint64_t add_listener(std::function<void()> fn) const;
  void remove_listener(uint64_t id) const;
  std::size_t listener_count() const;

  // Blocks until the deadline or cancellation. Returns false when cancelled.
  bool sleep_until(std::chrono::steady_clock::time_point deadline) const;

private:
  struct State;
  static void cancel_state(const std::shared_ptr<State>& s);

  std::shared_ptr<State> state_;
};

// Removes a listener when it goes out of scope.
class ListenerGuard {
public:
  ListenerGuard(const Context& ctx, std::function<void()> fn)
    : ctx_(ctx), id_(ctx.add_listener(std::move(fn))) {}
  ~ListenerGuard() {
    if (id_) ctx_.remove_listener(id_);
  }
  ListenerGuard(const ListenerGuard&) = delete;
  ListenerGuard& operator=(const ListenerGuard&) = delete;

private:
  Context ctx_;
  uint64_t id_;
};

}  // namespace siphon
