#include "context.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>

namespace siphon {

struct Context::State {
  std::mutex mutex;
  std::condition_variable cv;
  bool cancelled = false;
  uint64_t next_id = 1;
  std::map<uint64_t, std::function<void()>> listeners;
  // Held while listeners run so remove_listener cannot return mid-call.
  std::mutex dispatch;

  // Set for children: the listener registered on the parent.
  std::weak_ptr<State> parent;
  uint64_t parent_listener = 0;

  ~State() { detach(parent, parent_listener); }

  // Drops the parent's listener for this child. Takes only the parent's state
  // mutex, so it is safe while the parent is dispatching.
  static void detach(const std::weak_ptr<State>& from, uint64_t id) {
    if (id == 0) return;
    if (auto p = from.lock()) {
      std::lock_guard<std::mutex> lk(p->mutex);
      p->listeners.erase(id);
    }
  }
};

Context::Context() : state_(std::make_shared<State>()) {}

void Context::cancel_state(const std::shared_ptr<State>& s) {
  std::lock_guard<std::mutex> dispatch(s->dispatch);
  std::map<uint64_t, std::function<void()>> fired;
  std::weak_ptr<State> parent;
  uint64_t parent_listener = 0;
  {
    std::lock_guard<std::mutex> lk(s->mutex);
    if (s->cancelled) return;
    s->cancelled = true;
    fired.swap(s->listeners);
    parent.swap(s->parent);
    std::swap(parent_listener, s->parent_listener);
  }
  s->cv.notify_all();
  State::detach(parent, parent_listener);
  for (auto& kv : fired) kv.second();
}

void Context::cancel() { cancel_state(state_); }

bool Context::done() const {
  std::lock_guard<std::mutex> lk(state_->mutex);
  return state_->cancelled;
}

MaybeError Context::err() const {
  if (!done()) return std::nullopt;
  return Error{ErrorCode::Cancelled, "context canceled"};
}

Context Context::child() const {
  Context c;
  std::weak_ptr<State> weak = c.state_;
  uint64_t id = add_listener([weak] {
    if (auto s = weak.lock()) cancel_state(s);
  });
  if (id != 0) {
    std::lock_guard<std::mutex> lk(c.state_->mutex);
    if (c.state_->cancelled) {
      // The parent was cancelled in between and its listener already ran.
      State::detach(state_, id);
    } else {
      c.state_->parent = state_;
      c.state_->parent_listener = id;
    }
  }
  return c;
}

uint64_t Context::add_listener(std::function<void()> fn) const {
  {
    std::lock_guard<std::mutex> lk(state_->mutex);
    if (!state_->cancelled) {
      uint64_t id = state_->next_id++;
      state_->listeners.emplace(id, std::move(fn));
      return id;
    }
  }
  fn();
  return 0;
}

std::size_t Context::listener_count() const {
  std::lock_guard<std::mutex> lk(state_->mutex);
  return state_->listeners.size();
}

void Context::remove_listener(uint64_t id) const {
  std::lock_guard<std::mutex> dispatch(state_->dispatch);
  std::lock_guard<std::mutex> lk(state_->mutex);
  state_->listeners.erase(id);
}

bool Context::sleep_until(std::chrono::steady_clock::time_point deadline) const {
  std::unique_lock<std::mutex> lk(state_->mutex);
  state_->cv.wait_until(lk, deadline, [this] { return state_->cancelled; });
  return !state_->cancelled;
}

}  // namespace siphon
