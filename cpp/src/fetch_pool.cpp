#include "fetch_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace siphon {

std::string resolve_table(const RequestSpec& spec) {
  if (!spec.table.empty()) return spec.table;
  std::string table = url_path(spec.request.url);
  table.erase(std::remove(table.begin(), table.end(), '/'), table.end());
  return table;
}

TableRef destination(const RequestSpec& spec) {
  return TableRef{spec.database, resolve_table(spec)};
}

FetchWorkerPool::FetchWorkerPool(std::shared_ptr<Client> client,
                                 std::shared_ptr<RateLimiter> limiter,
                                 std::shared_ptr<ErrorSlot> errors, std::size_t workers)
  : client_(std::move(client))
  , limiter_(std::move(limiter))
  , errors_(std::move(errors))
  , workers_(workers > 0 ? workers : default_workers())
{}

FetchWorkerPool::~FetchWorkerPool() { stop(); }

void FetchWorkerPool::start(const Context& ctx, const std::vector<RequestSpec>& requests) {
  const std::size_t n = requests.size();
  parent_ = ctx;
  ctx_ = ctx.child();
  jobs_ = std::make_unique<Channel<FetchJob>>(n);
  results_ = std::make_unique<Channel<FetchResultPtr>>(n);

  // The job queue holds the whole batch, so it can be filled and closed
  // before any worker runs.
  for (const auto& spec : requests) jobs_->send(FetchJob{spec, client_, limiter_});
  jobs_->close();

  const std::size_t count = std::max<std::size_t>(1, std::min(workers_, n));
  barrier_ = std::make_unique<CompletionBarrier>(count, [this] { results_->close(); });
  spdlog::debug("fetch pool: {} workers, {} requests", count, n);
  for (std::size_t i = 0; i < count; i++)
    threads_.emplace_back(&FetchWorkerPool::worker_thread, this, i);
}

void FetchWorkerPool::stop() {
  ctx_.cancel();
  for (auto& t : threads_)
    if (t.joinable()) t.join();
  threads_.clear();
}

void FetchWorkerPool::worker_thread(std::size_t index) {
  FetchJob job;
  std::size_t handled = 0;
  while (jobs_->recv(job) == RecvStatus::Value) {
    results_->send(fetch(job));
    handled++;
  }
  spdlog::debug("fetch worker {} exiting after {} requests", index, handled);
  barrier_->arrive();
}

FetchResultPtr FetchWorkerPool::fetch(const FetchJob& job) {
  auto result = std::make_shared<FetchResult>();
  result->url = job.spec.request.url;
  result->database = job.spec.database;

  auto fail = [&](const Error& err, const char* stage) {
    Error wrapped = wrap_error(err, std::string(stage) + " " + result->url);
    // A cancellation the caller did not ask for comes from stop() and is not
    // a failure of the run.
    bool stopped = err.code == ErrorCode::Cancelled && !parent_.done();
    if (!stopped) errors_->record(wrapped);
    result->error = std::move(wrapped);
  };

  if (job.limiter) {
    if (auto err = job.limiter->wait(ctx_)) fail(*err, "rate limiter");
  } else if (auto err = ctx_.err()) {
    fail(*err, "fetch");
  }

  if (!result->error) {
    auto rsp = job.client->send(job.spec.request);
    if (rsp)
      result->response = std::make_shared<Response>(std::move(rsp).value());
    else
      fail(rsp.error(), "fetch");
  }

  result->table = resolve_table(job.spec);
  return result;
}

}  // namespace siphon
