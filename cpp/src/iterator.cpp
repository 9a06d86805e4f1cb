#include "iterator.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace siphon {

ResponseIterator::ResponseIterator(std::shared_ptr<Client> client,
                                   std::shared_ptr<RateLimiter> limiter,
                                   std::vector<RequestSpec> requests,
                                   std::shared_ptr<ErrorSlot> errors, std::size_t workers)
  : client_(std::move(client))
  , limiter_(std::move(limiter))
  , requests_(std::move(requests))
  , fetch_errors_(std::make_shared<ErrorSlot>(std::move(errors)))
  , workers_(workers)
{}

ResponseIterator::~ResponseIterator() { close(); }

bool ResponseIterator::advance(const Context& ctx) {
  Channel<FetchResultPtr>* results = nullptr;
  {
    std::unique_lock<std::shared_mutex> lk(mutex_);
    if (closed_ || terminal(state_)) return false;

    if (state_ == State::Unstarted) {
      if (auto err = ctx.err()) {
        state_ = State::Canceled;
        last_error_ = std::move(err);
        return false;
      }
      pool_ = std::make_unique<FetchWorkerPool>(client_, limiter_, fetch_errors_, workers_);
      pool_->start(ctx, requests_);
      state_ = State::Running;
    }
    results = &pool_->results();
  }

  // Wait without the lock so close(), current() and err() stay responsive.
  FetchResultPtr next;
  RecvStatus status = results->recv(ctx, next);

  std::unique_lock<std::shared_mutex> lk(mutex_);
  if (closed_) return false;
  switch (status) {
    case RecvStatus::Value:
      current_ = std::move(next);
      last_error_.reset();
      return true;
    case RecvStatus::Cancelled:
      state_ = State::Canceled;
      last_error_ = ctx.err();
      return false;
    case RecvStatus::Closed:
      last_error_ = fetch_errors_->get();
      state_ = last_error_ ? State::Errored : State::Exhausted;
      return false;
  }
  return false;
}

FetchResultPtr ResponseIterator::current() const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  return current_;
}

MaybeError ResponseIterator::err() const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  return last_error_;
}

MaybeError ResponseIterator::close() {
  FetchWorkerPool* pool = nullptr;
  {
    std::unique_lock<std::shared_mutex> lk(mutex_);
    if (closed_) return std::nullopt;
    closed_ = true;
    pool = pool_.get();
  }
  // The pool object itself lives until destruction: a concurrent advance()
  // may still be waiting on its results channel.
  if (pool) pool->stop();
  spdlog::debug("response iterator closed");
  return std::nullopt;
}

ResponseIterator::State ResponseIterator::state() const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  return state_;
}

bool ResponseIterator::closed() const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  return closed_;
}

}  // namespace siphon
