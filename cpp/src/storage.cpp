#include "storage.hpp"
#include "memory_storage.hpp"
#include "pg_storage.hpp"
#include <spdlog/spdlog.h>

namespace siphon {

void BasicTransaction::send(TxWork work) {
  std::lock_guard<std::mutex> lk(mutex_);
  if (finished_) {
    spdlog::warn("transaction: unit sent after commit or rollback was dropped");
    return;
  }
  if (failure_) return;
  if (auto err = ctx_.err()) {
    failure_ = wrap_error(*err, "transaction");
    return;
  }
  if (auto err = work(ctx_, scope_)) failure_ = Error{ErrorCode::TransactionFailed, err->message};
}

MaybeError BasicTransaction::commit() {
  std::lock_guard<std::mutex> lk(mutex_);
  if (finished_) return Error{ErrorCode::InvalidState, "transaction already finished"};
  finished_ = true;
  if (failure_) {
    if (auto err = do_rollback())
      spdlog::warn("transaction: rollback after failed unit: {}", err->message);
    return wrap_error(*failure_, "transaction rolled back");
  }
  if (auto err = do_commit()) {
    if (auto rb = do_rollback()) spdlog::warn("transaction: rollback after failed commit: {}", rb->message);
    return Error{ErrorCode::TransactionFailed, "commit: " + err->message};
  }
  return std::nullopt;
}

MaybeError BasicTransaction::rollback() {
  std::lock_guard<std::mutex> lk(mutex_);
  if (finished_) return std::nullopt;
  finished_ = true;
  return do_rollback();
}

void BasicTransaction::finish_on_destroy() {
  std::lock_guard<std::mutex> lk(mutex_);
  if (finished_) return;
  finished_ = true;
  if (auto err = do_rollback()) spdlog::warn("transaction: implicit rollback: {}", err->message);
}

Result<std::unique_ptr<Storage>> open_storage(const std::string& dsn) {
  auto scheme_end = dsn.find("://");
  if (scheme_end == std::string::npos)
    return unable_to_parse("storage dsn \"" + dsn + "\"");
  std::string scheme = dsn.substr(0, scheme_end);

  if (scheme == "memory") return std::unique_ptr<Storage>(new MemoryStorage());

  if (scheme == "postgres" || scheme == "postgresql") {
    auto pg = std::make_unique<PgStorage>(dsn);
    if (auto err = pg->connect()) return *err;
    return std::unique_ptr<Storage>(std::move(pg));
  }

  return Error{ErrorCode::UnableToParse, "unsupported storage scheme \"" + scheme + "\""};
}

}  // namespace siphon
