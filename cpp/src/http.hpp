#pragma once

#include "error.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace siphon {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive lookup of the first header named `name`; empty if absent.
std::string header_value(const Headers& headers, std::string_view name);

struct Request {
  std::string method = "GET";
  std::string url;
  Headers headers;
  std::string body;
};

struct Response {
  int status_code = 0;
  std::string url;  // request URL the response answers
  Headers headers;
  std::string body;

  std::string header(std::string_view name) const { return header_value(headers, name); }
};

// Performs one HTTP exchange. Implementations must be safe for concurrent use
// with distinct requests.
class Client {
public:
  virtual ~Client() = default;
  virtual Result<Response> send(const Request& req) = 0;
};

// Path component of a URL ("https://h/v1/items?x=1" -> "/v1/items").
std::string url_path(std::string_view url);

}  // namespace siphon
