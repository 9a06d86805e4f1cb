#pragma once

#include "http.hpp"
#include <string>

namespace siphon {

struct CurlOptions {
  int timeout_sec = 30;
  long max_redirects = 5;
  std::string user_agent = "siphon/1.0";
  Headers default_headers;  // sent with every request unless the request sets them
};

// Applies one raw header line as libcurl delivers it. A status line starts the
// headers of a new response (a redirect target) and drops what was collected.
void apply_header_line(std::string line, Headers& out);

// The request's headers plus each default the request does not set itself.
Headers merge_headers(const Headers& request, const Headers& defaults);

// Synchronous libcurl client. Each send() uses its own easy handle, so one
// instance can be shared by all fetch workers.
class CurlClient : public Client {
public:
  explicit CurlClient(CurlOptions opts = {});

  Result<Response> send(const Request& req) override;

private:
  CurlOptions opts_;
};

}  // namespace siphon
