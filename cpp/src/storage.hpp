#pragma once

#include "context.hpp"
#include "error.hpp"
#include "negotiate.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace siphon {

struct UpsertRequest {
  std::string table;
  std::string database;  // empty: the storage's default namespace
  std::string data;
  DecodeType data_type = DecodeType::Json;
};

struct UpsertResult {
  uint64_t upserted_count = 0;
};

// A destination table. An empty database means the storage's default
// namespace; neither part is split or parsed further.
struct TableRef {
  std::string database;
  std::string table;
};

// Table name -> stored record count.
using TableSizes = std::map<std::string, uint64_t>;
// Table name -> primary key columns in key order.
using PrimaryKeys = std::map<std::string, std::vector<std::string>>;

class Storage;

// A unit of transactional work. It receives the transaction-scoped handle,
// which must be used instead of the storage that started the transaction.
using TxWork = std::function<MaybeError(const Context&, Storage&)>;

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void send(TxWork work) = 0;
  // Fails, and rolls back, if any unit sent so far has failed.
  virtual MaybeError commit() = 0;
  virtual MaybeError rollback() = 0;
};

class Storage {
public:
  virtual ~Storage() = default;

  virtual std::string type() const = 0;

  virtual Result<UpsertResult> upsert(const Context& ctx, const UpsertRequest& req) = 0;
  virtual Result<std::unique_ptr<Transaction>> start_transaction(const Context& ctx) = 0;
  virtual Result<TableSizes> list_tables(const Context& ctx) = 0;
  virtual Result<PrimaryKeys> list_primary_keys(const Context& ctx) = 0;
  virtual MaybeError truncate(const Context& ctx, const std::vector<TableRef>& tables) = 0;
  virtual MaybeError close() = 0;
};

// Runs each unit as it is sent. After the first failure later units are
// skipped and commit() turns into a rollback that reports that failure.
// Subclasses supply the engine-specific commit and rollback and must call
// finish_on_destroy() from their destructor.
class BasicTransaction : public Transaction {
public:
  BasicTransaction(Context ctx, Storage& scope) : ctx_(std::move(ctx)), scope_(scope) {}

  void send(TxWork work) override;
  MaybeError commit() override;
  MaybeError rollback() override;

protected:
  virtual MaybeError do_commit() = 0;
  virtual MaybeError do_rollback() = 0;

  // Rolls back a transaction that was neither committed nor rolled back.
  void finish_on_destroy();

private:
  Context ctx_;
  Storage& scope_;
  std::mutex mutex_;
  MaybeError failure_;
  bool finished_ = false;
};

// Opens a storage by URI scheme: postgres://, postgresql:// or memory://.
Result<std::unique_ptr<Storage>> open_storage(const std::string& dsn);

}  // namespace siphon
