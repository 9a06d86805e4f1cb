#include "memory_storage.hpp"

namespace siphon {

namespace {

Error closed_error() { return Error{ErrorCode::StorageFailed, "memory storage is closed"}; }

}  // namespace

// Stages units in a private MemoryStorage and merges it on commit.
class MemoryTransaction : public BasicTransaction {
public:
  MemoryTransaction(Context ctx, MemoryStorage& parent, std::unique_ptr<MemoryStorage> staged)
    : BasicTransaction(std::move(ctx), *staged), parent_(parent), staged_(std::move(staged)) {}

  ~MemoryTransaction() override { finish_on_destroy(); }

protected:
  MaybeError do_commit() override {
    parent_.merge(*staged_);
    return std::nullopt;
  }

  MaybeError do_rollback() override {
    std::lock_guard<std::mutex> lk(staged_->mutex_);
    staged_->tables_.clear();
    return std::nullopt;
  }

private:
  MemoryStorage& parent_;
  std::unique_ptr<MemoryStorage> staged_;
};

Result<UpsertResult> MemoryStorage::upsert(const Context& ctx, const UpsertRequest& req) {
  if (auto err = ctx.err()) return *err;
  if (req.table.empty()) return missing_config_field("table");
  if (req.data_type != DecodeType::Json)
    return Error{ErrorCode::StorageFailed,
                 "unsupported data type " + std::string(decode_type_name(req.data_type))};

  std::lock_guard<std::mutex> lk(mutex_);
  if (closed_) return closed_error();
  tables_[key(req.database, req.table)].push_back(req.data);
  return UpsertResult{1};
}

Result<std::unique_ptr<Transaction>> MemoryStorage::start_transaction(const Context& ctx) {
  if (auto err = ctx.err()) return *err;
  PrimaryKeys keys;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) return closed_error();
    keys = keys_;
  }
  return std::unique_ptr<Transaction>(
      new MemoryTransaction(ctx, *this, std::make_unique<MemoryStorage>(std::move(keys))));
}

Result<TableSizes> MemoryStorage::list_tables(const Context& ctx) {
  if (auto err = ctx.err()) return *err;
  std::lock_guard<std::mutex> lk(mutex_);
  if (closed_) return closed_error();
  TableSizes out;
  for (const auto& kv : tables_) out[kv.first] = kv.second.size();
  return out;
}

Result<PrimaryKeys> MemoryStorage::list_primary_keys(const Context& ctx) {
  if (auto err = ctx.err()) return *err;
  std::lock_guard<std::mutex> lk(mutex_);
  if (closed_) return closed_error();
  return keys_;
}

MaybeError MemoryStorage::truncate(const Context& ctx, const std::vector<TableRef>& tables) {
  if (auto err = ctx.err()) return err;
  std::lock_guard<std::mutex> lk(mutex_);
  if (closed_) return closed_error();
  for (const auto& t : tables) {
    auto it = tables_.find(key(t.database, t.table));
    if (it != tables_.end()) it->second.clear();
  }
  return std::nullopt;
}

MaybeError MemoryStorage::close() {
  std::lock_guard<std::mutex> lk(mutex_);
  closed_ = true;
  return std::nullopt;
}

std::vector<std::string> MemoryStorage::records(const std::string& table) const {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = tables_.find(table);
  if (it == tables_.end()) return {};
  return it->second;
}

std::string MemoryStorage::key(const std::string& database, const std::string& table) {
  return database.empty() ? table : database + "." + table;
}

void MemoryStorage::merge(const MemoryStorage& staged) {
  std::scoped_lock lk(mutex_, staged.mutex_);
  for (const auto& kv : staged.tables_) {
    auto& dst = tables_[kv.first];
    dst.insert(dst.end(), kv.second.begin(), kv.second.end());
  }
}

}  // namespace siphon
