#pragma once

#include "fetch_pool.hpp"
#include <memory>
#include <shared_mutex>
#include <vector>

namespace siphon {

// Single-consumer cursor over the responses of a batch of requests. The
// requests are fetched concurrently, starting with the first advance();
// results arrive in completion order.
//
//   ResponseIterator it(client, nullptr, requests);
//   while (it.advance(ctx)) use(it.current());
//   if (auto err = it.err()) ...;   // no error on a clean end of stream
//
// current() and err() may be called from any thread; advance() must only be
// driven by one.
class ResponseIterator {
public:
  enum class State { Unstarted, Running, Exhausted, Canceled, Errored };

  // errors: register shared with other stages of a run, may be null. Fetch
  // failures are recorded there and in the iterator's own slot; err() only
  // ever reports the latter.
  ResponseIterator(std::shared_ptr<Client> client, std::shared_ptr<RateLimiter> limiter,
                   std::vector<RequestSpec> requests, std::shared_ptr<ErrorSlot> errors = nullptr,
                   std::size_t workers = 0);
  ~ResponseIterator();

  ResponseIterator(const ResponseIterator&) = delete;
  ResponseIterator& operator=(const ResponseIterator&) = delete;

  // Blocks for the next result. Returns false once the stream is exhausted,
  // ctx is cancelled, the fetch stage failed, or the iterator is closed;
  // every later call returns false without changing err().
  bool advance(const Context& ctx);

  // Null before the first successful advance().
  FetchResultPtr current() const;
  MaybeError err() const;

  // Stops outstanding requests. Safe to call repeatedly and concurrently with
  // current() and err().
  MaybeError close();

  State state() const;
  bool closed() const;

private:
  static bool terminal(State s) {
    return s == State::Exhausted || s == State::Canceled || s == State::Errored;
  }

  std::shared_ptr<Client> client_;
  std::shared_ptr<RateLimiter> limiter_;
  std::vector<RequestSpec> requests_;
  std::shared_ptr<ErrorSlot> fetch_errors_;
  std::size_t workers_;

  // Guards everything below.
  mutable std::shared_mutex mutex_;
  State state_ = State::Unstarted;
  bool closed_ = false;
  FetchResultPtr current_;
  MaybeError last_error_;
  std::unique_ptr<FetchWorkerPool> pool_;
};

}  // namespace siphon
