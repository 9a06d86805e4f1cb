#pragma once

#include "channel.hpp"
#include "context.hpp"
#include "error.hpp"
#include "negotiate.hpp"
#include "storage.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace siphon {

struct UpsertJob {
  std::string table;
  std::string database;
  std::string data;
  DecodeType data_type = DecodeType::Unknown;
};

// Worker threads that forward each submitted job to every storage. A failing
// storage is recorded in the ErrorSlot and the remaining storages are still
// written; delivery across storages is not atomic.
class UpsertWorkerPool {
public:
  UpsertWorkerPool(std::vector<std::shared_ptr<Storage>> writers,
                   std::shared_ptr<ErrorSlot> errors, std::size_t workers, std::size_t capacity);
  ~UpsertWorkerPool();

  UpsertWorkerPool(const UpsertWorkerPool&) = delete;
  UpsertWorkerPool& operator=(const UpsertWorkerPool&) = delete;

  void start(const Context& ctx);

  // Blocks while the queue is full. False once the queue is closed.
  bool submit(UpsertJob job);

  // No submit() succeeds after close().
  void close();

  // Returns when every worker has drained the queue and exited.
  void wait();

  uint64_t upserted() const { return upserted_.load(); }

private:
  void worker_thread(std::size_t index);
  void write(const UpsertJob& job);

  std::vector<std::shared_ptr<Storage>> writers_;
  std::shared_ptr<ErrorSlot> errors_;
  std::size_t workers_;

  Context ctx_;
  Channel<UpsertJob> jobs_;
  std::unique_ptr<CompletionBarrier> barrier_;
  std::vector<std::thread> threads_;
  std::atomic<uint64_t> upserted_{0};
};

}  // namespace siphon
