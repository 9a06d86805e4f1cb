#pragma once

#include "storage.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace siphon {

// PostgreSQL storage over a single libpq connection. JSON payloads (one object
// or an array of objects) are upserted with jsonb_populate_recordset and
// ON CONFLICT on the table's primary key. The database name of a request maps
// to a schema. Transactions use their own connection.
class PgStorage : public Storage {
public:
  explicit PgStorage(const std::string& conninfo);
  ~PgStorage() override;

  MaybeError connect();
  void disconnect();

  std::string type() const override { return "postgres"; }

  Result<UpsertResult> upsert(const Context& ctx, const UpsertRequest& req) override;
  Result<std::unique_ptr<Transaction>> start_transaction(const Context& ctx) override;
  Result<TableSizes> list_tables(const Context& ctx) override;
  Result<PrimaryKeys> list_primary_keys(const Context& ctx) override;
  MaybeError truncate(const Context& ctx, const std::vector<TableRef>& tables) override;
  MaybeError close() override;

private:
  friend class PgTransaction;

  struct TableShape {
    std::vector<std::string> columns;
    std::vector<std::string> primary_key;
  };

  // Runs one statement; rows come back as text. Caller holds mutex_.
  Result<std::vector<std::vector<std::string>>> exec_locked(
      const std::string& sql, const std::vector<std::string>& params, uint64_t* affected = nullptr);
  Result<TableShape> shape_locked(const std::string& schema, const std::string& table);

  std::string conninfo_;
  std::mutex mutex_;
  void* conn_ = nullptr;  // PGconn*
  std::map<std::string, TableShape> shapes_;
};

// Quoted "schema"."table", or "table" for an empty schema. Dots inside either
// name stay part of that name.
std::string pg_qualified_name(const std::string& schema, const std::string& table);

}  // namespace siphon
