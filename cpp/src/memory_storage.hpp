#pragma once

#include "storage.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace siphon {

// In-process storage. Each upsert stores its payload as one record under
// "database.table" (or "table" without a database). Used for dry runs
// (memory://) and as the reference backend in tests.
class MemoryStorage : public Storage {
public:
  MemoryStorage() = default;
  explicit MemoryStorage(PrimaryKeys keys) : keys_(std::move(keys)) {}

  std::string type() const override { return "memory"; }

  Result<UpsertResult> upsert(const Context& ctx, const UpsertRequest& req) override;
  Result<std::unique_ptr<Transaction>> start_transaction(const Context& ctx) override;
  Result<TableSizes> list_tables(const Context& ctx) override;
  Result<PrimaryKeys> list_primary_keys(const Context& ctx) override;
  MaybeError truncate(const Context& ctx, const std::vector<TableRef>& tables) override;
  MaybeError close() override;

  std::vector<std::string> records(const std::string& table) const;

private:
  friend class MemoryTransaction;

  static std::string key(const std::string& database, const std::string& table);

  // Appends every record of `staged` to this storage.
  void merge(const MemoryStorage& staged);

  mutable std::mutex mutex_;
  std::map<std::string, std::vector<std::string>> tables_;
  PrimaryKeys keys_;
  bool closed_ = false;
};

}  // namespace siphon
