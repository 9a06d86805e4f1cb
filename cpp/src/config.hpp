#pragma once

#include "error.hpp"
#include "fetch_pool.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace siphon {

struct RateLimitConfig {
  int requests = 0;
  std::chrono::milliseconds interval{0};
  int burst = 1;
};

struct Config {
  std::vector<RequestSpec> requests;
  std::vector<std::string> storage;  // DSNs; none means responses are discarded
  std::optional<RateLimitConfig> rate_limit;
  std::size_t workers = 0;           // 0: one per core
  int timeout_sec = 30;
  std::string user_agent = "siphon/1.0";
  bool truncate = false;
  std::string log_level = "info";
  bool help = false;
};

// Parses the command line and validates the result. --table, --database,
// --method and --header apply to the most recent --url.
Result<Config> parse_args(int argc, char* argv[]);

MaybeError validate(const Config& cfg);

std::string usage(const char* prog);

}  // namespace siphon
