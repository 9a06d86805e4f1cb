#include "test_support.hpp"
#include <thread>

namespace siphon::test {

void FakeClient::route(const std::string& url, Route r) {
  std::lock_guard<std::mutex> lk(mutex_);
  routes_[url] = std::move(r);
}

void FakeClient::set_default(Route r) {
  std::lock_guard<std::mutex> lk(mutex_);
  default_ = std::move(r);
}

Result<Response> FakeClient::send(const Request& req) {
  calls_++;
  Route r;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = routes_.find(req.url);
    r = it == routes_.end() ? default_ : it->second;
  }
  if (r.delay.count() > 0) std::this_thread::sleep_for(r.delay);
  if (r.fail) return Error{ErrorCode::RequestFailed, "connection refused"};

  Response rsp;
  rsp.status_code = r.status;
  rsp.url = req.url;
  rsp.body = r.body;
  if (!r.content_type.empty()) rsp.headers.emplace_back("Content-Type", r.content_type);
  return rsp;
}

std::vector<RequestSpec> make_requests(std::size_t n) {
  std::vector<RequestSpec> out;
  for (std::size_t i = 0; i < n; i++) {
    RequestSpec spec;
    spec.request.url = "https://api.test/items/" + std::to_string(i);
    out.push_back(std::move(spec));
  }
  return out;
}

uint64_t total_records(MemoryStorage& stg) {
  Context ctx;
  auto tables = stg.list_tables(ctx);
  uint64_t n = 0;
  if (!tables) return n;
  for (const auto& kv : *tables) n += kv.second;
  return n;
}

}  // namespace siphon::test
