#include "engine.hpp"
#include "fetcher.hpp"
#include "negotiate.hpp"
#include "upsert_pool.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace siphon {

Engine::Engine() : client_(std::make_shared<CurlClient>()) {}

Engine& Engine::client(std::shared_ptr<Client> client) {
  client_ = std::move(client);
  return *this;
}

Engine& Engine::rate_limiter(std::shared_ptr<RateLimiter> limiter) {
  limiter_ = std::move(limiter);
  return *this;
}

Engine& Engine::requests(std::vector<RequestSpec> reqs) {
  for (auto& r : reqs) requests_.push_back(std::move(r));
  return *this;
}

Engine& Engine::upsert_writers(std::vector<std::shared_ptr<Storage>> writers) {
  for (auto& w : writers) writers_.push_back(std::move(w));
  return *this;
}

Engine& Engine::workers(std::size_t n) {
  workers_ = n;
  return *this;
}

MaybeError Engine::run(const Context& ctx) {
  if (requests_.empty()) return std::nullopt;

  auto started = std::chrono::steady_clock::now();
  errors_ = std::make_shared<ErrorSlot>();
  submitted_ = 0;
  iterator_ = std::make_unique<ResponseIterator>(client_, limiter_, requests_, errors_, workers_);

  UpsertWorkerPool pool(writers_, errors_, workers_, requests_.size());
  pool.start(ctx);

  while (iterator_->advance(ctx)) {
    FetchResultPtr cur = iterator_->current();
    // No response: the failure is already in the register.
    if (!cur->response) continue;

    std::string content_type = cur->response->header("Content-Type");
    cur->data = std::move(cur->response->body);
    cur->response.reset();

    DecodeType fit = best_fit_decode_type(content_type);
    if (fit == DecodeType::Unknown) {
      errors_->record(Error{ErrorCode::UnsupportedDecodeType,
                            "unsupported decode type \"" + content_type + "\": \"" + cur->url + "\""});
      break;
    }

    if (!pool.submit(UpsertJob{cur->table, cur->database, std::move(cur->data), fit})) break;
    submitted_++;
  }

  pool.close();
  pool.wait();
  MaybeError iter_err = iterator_->err();
  iterator_->close();

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  spdlog::info("run finished: {} requests, {} jobs, {} writes in {}ms", requests_.size(),
               submitted_, pool.upserted(), elapsed.count());

  if (auto err = errors_->get()) {
    if (errors_->dropped() > 0)
      spdlog::warn("{} further errors were dropped; reporting the first", errors_->dropped());
    return wrap_error(*err, "failed to upsert data");
  }
  if (iter_err) return wrap_error(*iter_err, "error iterating over requests");
  return std::nullopt;
}

}  // namespace siphon
