#include "pg_storage.hpp"
#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace siphon {

namespace {

using Rows = std::vector<std::vector<std::string>>;

std::string quote_ident(const std::string& ident) {
  std::string out = "\"";
  for (char ch : ident) {
    if (ch == '"') out += '"';
    out += ch;
  }
  out += '"';
  return out;
}

std::string join_quoted(const std::vector<std::string>& names) {
  std::string out;
  for (size_t i = 0; i < names.size(); i++) {
    if (i) out += ", ";
    out += quote_ident(names[i]);
  }
  return out;
}

std::string last_error(PGconn* c) {
  std::string msg = c ? PQerrorMessage(c) : "no connection";
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
  return msg;
}

Error pg_error(const std::string& what, const Error& cause) {
  return Error{ErrorCode::StorageFailed, "postgres: " + what + ": " + cause.message};
}

constexpr const char* kColumnsSql =
    "SELECT column_name FROM information_schema.columns "
    "WHERE table_schema = COALESCE(NULLIF($1, ''), current_schema()) AND table_name = $2 "
    "ORDER BY ordinal_position";

constexpr const char* kPrimaryKeySql =
    "SELECT tc.table_name, kcu.column_name "
    "FROM information_schema.table_constraints tc "
    "JOIN information_schema.key_column_usage kcu "
    "  ON tc.constraint_name = kcu.constraint_name "
    " AND tc.table_schema = kcu.table_schema AND tc.table_name = kcu.table_name "
    "WHERE tc.constraint_type = 'PRIMARY KEY' "
    "  AND tc.table_schema = COALESCE(NULLIF($1, ''), current_schema()) "
    "  AND ($2 = '' OR tc.table_name = $2) "
    "ORDER BY tc.table_name, kcu.ordinal_position";

}  // namespace

std::string pg_qualified_name(const std::string& schema, const std::string& table) {
  if (schema.empty()) return quote_ident(table);
  return quote_ident(schema) + "." + quote_ident(table);
}

class PgTransaction : public BasicTransaction {
public:
  PgTransaction(Context ctx, std::unique_ptr<PgStorage> conn)
    : BasicTransaction(std::move(ctx), *conn), conn_(std::move(conn)) {}

  ~PgTransaction() override { finish_on_destroy(); }

protected:
  MaybeError do_commit() override { return run("COMMIT"); }
  MaybeError do_rollback() override { return run("ROLLBACK"); }

private:
  MaybeError run(const std::string& sql) {
    std::lock_guard<std::mutex> lk(conn_->mutex_);
    auto res = conn_->exec_locked(sql, {});
    if (!res) return pg_error(sql, res.error());
    return std::nullopt;
  }

  std::unique_ptr<PgStorage> conn_;
};

PgStorage::PgStorage(const std::string& conninfo) : conninfo_(conninfo) {}

PgStorage::~PgStorage() { disconnect(); }

MaybeError PgStorage::connect() {
  std::lock_guard<std::mutex> lk(mutex_);
  if (conn_) return std::nullopt;
  PGconn* c = PQconnectdb(conninfo_.c_str());
  if (PQstatus(c) != CONNECTION_OK) {
    Error err{ErrorCode::StorageFailed, "postgres: connect failed: " + last_error(c)};
    PQfinish(c);
    return err;
  }
  conn_ = c;
  return std::nullopt;
}

void PgStorage::disconnect() {
  if (conn_) {
    PQfinish(static_cast<PGconn*>(conn_));
    conn_ = nullptr;
  }
}

Result<Rows> PgStorage::exec_locked(const std::string& sql, const std::vector<std::string>& params,
                                    uint64_t* affected) {
  PGconn* c = static_cast<PGconn*>(conn_);
  if (!c) return Error{ErrorCode::StorageFailed, "not connected"};

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& p : params) values.push_back(p.c_str());

  std::unique_ptr<PGresult, decltype(&PQclear)> res(
      PQexecParams(c, sql.c_str(), static_cast<int>(values.size()), nullptr,
                   values.empty() ? nullptr : values.data(), nullptr, nullptr, 0),
      &PQclear);
  ExecStatusType status = PQresultStatus(res.get());
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK)
    return Error{ErrorCode::StorageFailed, last_error(c)};

  Rows rows;
  int n = PQntuples(res.get());
  int m = PQnfields(res.get());
  rows.reserve(n);
  for (int i = 0; i < n; i++) {
    std::vector<std::string> row;
    row.reserve(m);
    for (int j = 0; j < m; j++) row.emplace_back(PQgetvalue(res.get(), i, j));
    rows.push_back(std::move(row));
  }
  if (affected) {
    const char* count = PQcmdTuples(res.get());
    *affected = (count && *count) ? std::stoull(count) : 0;
  }
  return rows;
}

Result<PgStorage::TableShape> PgStorage::shape_locked(const std::string& schema,
                                                      const std::string& table) {
  std::string key = schema + "." + table;
  auto it = shapes_.find(key);
  if (it != shapes_.end()) return it->second;

  auto cols = exec_locked(kColumnsSql, {schema, table});
  if (!cols) return cols.error();
  if (cols->empty())
    return Error{ErrorCode::StorageFailed, "table " + pg_qualified_name(schema, table) + " does not exist"};
  auto keys = exec_locked(kPrimaryKeySql, {schema, table});
  if (!keys) return keys.error();

  TableShape shape;
  for (auto& row : *cols) shape.columns.push_back(std::move(row[0]));
  for (auto& row : *keys) shape.primary_key.push_back(std::move(row[1]));
  shapes_.emplace(key, shape);
  return shape;
}

Result<UpsertResult> PgStorage::upsert(const Context& ctx, const UpsertRequest& req) {
  if (auto err = ctx.err()) return *err;
  if (req.data_type != DecodeType::Json)
    return Error{ErrorCode::StorageFailed,
                 "postgres: unsupported data type " + std::string(decode_type_name(req.data_type))};

  std::lock_guard<std::mutex> lk(mutex_);
  auto shape = shape_locked(req.database, req.table);
  if (!shape) return pg_error("upsert into " + req.table, shape.error());

  std::string target = pg_qualified_name(req.database, req.table);
  std::string cols = join_quoted(shape->columns);
  std::string sql = "INSERT INTO " + target + " (" + cols + ") SELECT " + cols +
                    " FROM jsonb_populate_recordset(NULL::" + target +
                    ", CASE jsonb_typeof($1::jsonb) WHEN 'array' THEN $1::jsonb"
                    " ELSE jsonb_build_array($1::jsonb) END)";
  if (!shape->primary_key.empty()) {
    std::string updates;
    for (const auto& col : shape->columns) {
      bool is_key = false;
      for (const auto& k : shape->primary_key) is_key = is_key || k == col;
      if (is_key) continue;
      if (!updates.empty()) updates += ", ";
      updates += quote_ident(col) + " = EXCLUDED." + quote_ident(col);
    }
    sql += " ON CONFLICT (" + join_quoted(shape->primary_key) + ") DO " +
           (updates.empty() ? std::string("NOTHING") : "UPDATE SET " + updates);
  }

  uint64_t affected = 0;
  auto res = exec_locked(sql, {req.data}, &affected);
  if (!res) return pg_error("upsert into " + req.table, res.error());
  spdlog::debug("postgres: upserted {} rows into {}", affected, target);
  return UpsertResult{affected};
}

Result<std::unique_ptr<Transaction>> PgStorage::start_transaction(const Context& ctx) {
  if (auto err = ctx.err()) return *err;
  auto conn = std::make_unique<PgStorage>(conninfo_);
  if (auto err = conn->connect()) return *err;
  {
    std::lock_guard<std::mutex> lk(conn->mutex_);
    auto res = conn->exec_locked("BEGIN", {});
    if (!res) return pg_error("BEGIN", res.error());
  }
  return std::unique_ptr<Transaction>(new PgTransaction(ctx, std::move(conn)));
}

Result<TableSizes> PgStorage::list_tables(const Context& ctx) {
  if (auto err = ctx.err()) return *err;
  std::lock_guard<std::mutex> lk(mutex_);
  auto names = exec_locked(
      "SELECT tablename FROM pg_tables WHERE schemaname = current_schema() ORDER BY tablename", {});
  if (!names) return pg_error("list tables", names.error());

  TableSizes out;
  for (const auto& row : *names) {
    auto count = exec_locked("SELECT count(*) FROM " + quote_ident(row[0]), {});
    if (!count) return pg_error("count " + row[0], count.error());
    out[row[0]] = std::stoull(count->at(0).at(0));
  }
  return out;
}

Result<PrimaryKeys> PgStorage::list_primary_keys(const Context& ctx) {
  if (auto err = ctx.err()) return *err;
  std::lock_guard<std::mutex> lk(mutex_);
  auto rows = exec_locked(kPrimaryKeySql, {"", ""});
  if (!rows) return pg_error("list primary keys", rows.error());

  PrimaryKeys out;
  for (auto& row : *rows) out[row[0]].push_back(std::move(row[1]));
  return out;
}

MaybeError PgStorage::truncate(const Context& ctx, const std::vector<TableRef>& tables) {
  if (auto err = ctx.err()) return err;
  if (tables.empty()) return std::nullopt;

  std::string sql = "TRUNCATE ";
  for (size_t i = 0; i < tables.size(); i++) {
    if (i) sql += ", ";
    sql += pg_qualified_name(tables[i].database, tables[i].table);
  }
  std::lock_guard<std::mutex> lk(mutex_);
  auto res = exec_locked(sql, {});
  if (!res) return pg_error("truncate", res.error());
  return std::nullopt;
}

MaybeError PgStorage::close() {
  std::lock_guard<std::mutex> lk(mutex_);
  disconnect();
  return std::nullopt;
}

}  // namespace siphon
