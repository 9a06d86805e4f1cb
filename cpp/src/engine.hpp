#pragma once

#include "context.hpp"
#include "error.hpp"
#include "fetch_pool.hpp"
#include "http.hpp"
#include "iterator.hpp"
#include "rate_limiter.hpp"
#include "storage.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace siphon {

// Fetches a batch of requests and upserts every response into each storage.
//
//   Engine engine;
//   engine.rate_limiter(limiter).requests(reqs).upsert_writers({pg});
//   if (auto err = engine.run(ctx)) ...
class Engine {
public:
  // Uses a CurlClient until client() is called.
  Engine();

  Engine& client(std::shared_ptr<Client> client);
  Engine& rate_limiter(std::shared_ptr<RateLimiter> limiter);
  Engine& requests(std::vector<RequestSpec> reqs);
  Engine& upsert_writers(std::vector<std::shared_ptr<Storage>> writers);
  // Pool size for both stages; 0 means one worker per core.
  Engine& workers(std::size_t n);

  // Runs every request to completion. Fails with the first error recorded by
  // any stage; a response whose content type has no decoder aborts the run.
  MaybeError run(const Context& ctx);

  // Iterator of the latest run, null before the first one.
  ResponseIterator* iterator() { return iterator_.get(); }
  // Error register of the latest run, null before the first one.
  std::shared_ptr<ErrorSlot> last_errors() const { return errors_; }
  // Jobs handed to the upsert stage in the latest run.
  uint64_t submitted() const { return submitted_; }

private:
  std::shared_ptr<Client> client_;
  std::shared_ptr<RateLimiter> limiter_;
  std::vector<RequestSpec> requests_;
  std::vector<std::shared_ptr<Storage>> writers_;
  std::size_t workers_ = 0;

  std::unique_ptr<ResponseIterator> iterator_;
  std::shared_ptr<ErrorSlot> errors_;
  uint64_t submitted_ = 0;
};

}  // namespace siphon
