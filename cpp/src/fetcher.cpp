#include "fetcher.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace siphon {

namespace {

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, total);
  return total;
}

size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  size_t total = size * nmemb;
  apply_header_line(std::string(ptr, total), *static_cast<Headers*>(userdata));
  return total;
}

struct CurlDeleter {
  void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

std::once_flag g_curl_init;

}  // namespace

void apply_header_line(std::string line, Headers& out) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
  // A new status line starts the headers of a redirect target.
  if (line.rfind("HTTP/", 0) == 0) {
    out.clear();
    return;
  }
  auto colon = line.find(':');
  if (colon == std::string::npos) return;
  std::string value = line.substr(colon + 1);
  size_t start = value.find_first_not_of(" \t");
  value = start == std::string::npos ? "" : value.substr(start);
  out.emplace_back(line.substr(0, colon), std::move(value));
}

Headers merge_headers(const Headers& request, const Headers& defaults) {
  Headers out = request;
  for (const auto& h : defaults) {
    if (header_value(request, h.first).empty()) out.push_back(h);
  }
  return out;
}

CurlClient::CurlClient(CurlOptions opts) : opts_(std::move(opts)) {
  CURLcode rc = CURLE_OK;
  std::call_once(g_curl_init, [&rc] { rc = curl_global_init(CURL_GLOBAL_ALL); });
  if (rc != CURLE_OK)
    throw std::runtime_error(std::string("curl_global_init: ") + curl_easy_strerror(rc));
}

Result<Response> CurlClient::send(const Request& req) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) return Error{ErrorCode::RequestFailed, "curl_easy_init failed"};

  Response rsp;
  rsp.url = req.url;

  std::unique_ptr<curl_slist, SlistDeleter> hdrs;
  auto add_header = [&hdrs](const std::string& k, const std::string& v) {
    std::string line = k + ": " + v;
    hdrs.reset(curl_slist_append(hdrs.release(), line.c_str()));
  };
  for (const auto& h : merge_headers(req.headers, opts_.default_headers))
    add_header(h.first, h.second);

  CURL* c = curl.get();
  curl_easy_setopt(c, CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(c, CURLOPT_MAXREDIRS, opts_.max_redirects);
  curl_easy_setopt(c, CURLOPT_TIMEOUT, static_cast<long>(opts_.timeout_sec));
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, &rsp.body);
  curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, header_cb);
  curl_easy_setopt(c, CURLOPT_HEADERDATA, &rsp.headers);
  curl_easy_setopt(c, CURLOPT_USERAGENT, opts_.user_agent.c_str());
  curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 1L);
  if (hdrs) curl_easy_setopt(c, CURLOPT_HTTPHEADER, hdrs.get());
  if (req.method != "GET") curl_easy_setopt(c, CURLOPT_CUSTOMREQUEST, req.method.c_str());
  if (!req.body.empty()) {
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, req.body.data());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
  }

  CURLcode res = curl_easy_perform(c);
  if (res != CURLE_OK) {
    return Error{ErrorCode::RequestFailed,
                 "failed to make request " + req.method + " " + req.url + ": " +
                     curl_easy_strerror(res)};
  }

  long status_code = 0;
  curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status_code);
  rsp.status_code = static_cast<int>(status_code);
  if (rsp.status_code >= 400)
    spdlog::warn("{} {} returned status {}", req.method, req.url, rsp.status_code);
  return rsp;
}

}  // namespace siphon
