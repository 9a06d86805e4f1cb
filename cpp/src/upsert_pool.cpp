#include "upsert_pool.hpp"
#include <spdlog/spdlog.h>

namespace siphon {

UpsertWorkerPool::UpsertWorkerPool(std::vector<std::shared_ptr<Storage>> writers,
                                   std::shared_ptr<ErrorSlot> errors, std::size_t workers,
                                   std::size_t capacity)
  : writers_(std::move(writers))
  , errors_(std::move(errors))
  , workers_(workers > 0 ? workers : default_workers())
  , jobs_(capacity)
{}

UpsertWorkerPool::~UpsertWorkerPool() {
  close();
  for (auto& t : threads_)
    if (t.joinable()) t.join();
}

void UpsertWorkerPool::start(const Context& ctx) {
  ctx_ = ctx;
  barrier_ = std::make_unique<CompletionBarrier>(workers_, [this] {
    spdlog::debug("upsert pool drained, {} writes", upserted_.load());
  });
  for (std::size_t i = 0; i < workers_; i++)
    threads_.emplace_back(&UpsertWorkerPool::worker_thread, this, i);
}

bool UpsertWorkerPool::submit(UpsertJob job) { return jobs_.send(std::move(job)); }

void UpsertWorkerPool::close() { jobs_.close(); }

void UpsertWorkerPool::wait() {
  if (barrier_) barrier_->wait();
  for (auto& t : threads_)
    if (t.joinable()) t.join();
  threads_.clear();
}

void UpsertWorkerPool::worker_thread(std::size_t index) {
  UpsertJob job;
  while (jobs_.recv(ctx_, job) == RecvStatus::Value) write(job);
  spdlog::debug("upsert worker {} exiting", index);
  barrier_->arrive();
}

void UpsertWorkerPool::write(const UpsertJob& job) {
  UpsertRequest req{job.table, job.database, job.data, job.data_type};
  for (const auto& w : writers_) {
    auto res = w->upsert(ctx_, req);
    if (!res) {
      errors_->record(wrap_error(res.error(), "upsert " + job.table + " into " + w->type()));
      continue;
    }
    upserted_++;
  }
}

}  // namespace siphon
