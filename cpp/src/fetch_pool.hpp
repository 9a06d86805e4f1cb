#pragma once

#include "channel.hpp"
#include "context.hpp"
#include "error.hpp"
#include "http.hpp"
#include "rate_limiter.hpp"
#include "storage.hpp"
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace siphon {

// An HTTP request plus where its data should be stored.
struct RequestSpec {
  Request request;
  std::string database;  // optional
  std::string table;     // optional; see resolve_table()
};

// Explicit table name, else the URL path with every '/' removed.
std::string resolve_table(const RequestSpec& spec);

// Where a request's data is written: its database and resolved table.
TableRef destination(const RequestSpec& spec);

// Outcome of one request. A null response means the request produced no data;
// `error` then says why.
struct FetchResult {
  std::shared_ptr<Response> response;
  std::string url;
  std::string table;
  std::string database;
  std::string data;
  MaybeError error;
};

using FetchResultPtr = std::shared_ptr<FetchResult>;

struct FetchJob {
  RequestSpec spec;
  std::shared_ptr<Client> client;
  std::shared_ptr<RateLimiter> limiter;  // may be null
};

// Runs a fixed batch of requests on worker threads and publishes exactly one
// FetchResult per request on results(). Request-local failures go to the
// shared ErrorSlot and never stop a worker. The results channel is closed by
// a completion barrier once every worker has exited.
class FetchWorkerPool {
public:
  FetchWorkerPool(std::shared_ptr<Client> client, std::shared_ptr<RateLimiter> limiter,
                  std::shared_ptr<ErrorSlot> errors, std::size_t workers = 0);
  ~FetchWorkerPool();

  FetchWorkerPool(const FetchWorkerPool&) = delete;
  FetchWorkerPool& operator=(const FetchWorkerPool&) = delete;

  // Queues every request and starts the workers. Call once.
  void start(const Context& ctx, const std::vector<RequestSpec>& requests);

  // Valid after start().
  Channel<FetchResultPtr>& results() { return *results_; }

  // Cancels pending limiter waits and joins the workers. Requests not yet
  // issued are published without a response. Idempotent.
  void stop();

private:
  void worker_thread(std::size_t index);
  FetchResultPtr fetch(const FetchJob& job);

  std::shared_ptr<Client> client_;
  std::shared_ptr<RateLimiter> limiter_;
  std::shared_ptr<ErrorSlot> errors_;
  std::size_t workers_;

  Context parent_;
  Context ctx_;
  std::unique_ptr<Channel<FetchJob>> jobs_;
  std::unique_ptr<Channel<FetchResultPtr>> results_;
  std::unique_ptr<CompletionBarrier> barrier_;
  std::vector<std::thread> threads_;
};

}  // namespace siphon
