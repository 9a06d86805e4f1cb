#include "config.hpp"
#include "rate_limiter.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace siphon {

namespace {

Result<int> parse_int(const char* flag, const char* value) {
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(value, &end, 10);
  if (errno != 0 || end == value || *end != '\0' || v < INT_MIN || v > INT_MAX)
    return unable_to_parse(flag);
  return static_cast<int>(v);
}

bool valid_log_level(const std::string& level) {
  for (const char* l : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
    if (level == l) return true;
  }
  return false;
}

}  // namespace

Result<Config> parse_args(int argc, char* argv[]) {
  Config cfg;
  bool have_rate = false, have_interval = false;
  RateLimitConfig rate;

  for (int i = 1; i < argc; i++) {
    const char* arg = argv[i];
    if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
      cfg.help = true;
      return cfg;
    }
    if (std::strcmp(arg, "--truncate") == 0) {
      cfg.truncate = true;
      continue;
    }
    if (i + 1 >= argc) return missing_config_field(std::string(arg) + " value");
    const char* value = argv[++i];

    // Per-request options.
    if (std::strcmp(arg, "--url") == 0) {
      RequestSpec spec;
      spec.request.url = value;
      cfg.requests.push_back(std::move(spec));
      continue;
    }
    if (std::strcmp(arg, "--table") == 0 || std::strcmp(arg, "--database") == 0 ||
        std::strcmp(arg, "--method") == 0 || std::strcmp(arg, "--header") == 0) {
      if (cfg.requests.empty()) return missing_config_field(std::string("--url before ") + arg);
      RequestSpec& spec = cfg.requests.back();
      if (std::strcmp(arg, "--table") == 0) {
        spec.table = value;
      } else if (std::strcmp(arg, "--database") == 0) {
        spec.database = value;
      } else if (std::strcmp(arg, "--method") == 0) {
        spec.request.method = value;
      } else {
        const char* colon = std::strchr(value, ':');
        if (!colon) return unable_to_parse("--header");
        std::string v(colon + 1);
        size_t start = v.find_first_not_of(' ');
        spec.request.headers.emplace_back(std::string(value, colon - value),
                                          start == std::string::npos ? "" : v.substr(start));
      }
      continue;
    }

    if (std::strcmp(arg, "--storage") == 0) {
      cfg.storage.emplace_back(value);
    } else if (std::strcmp(arg, "--rate") == 0) {
      auto n = parse_int(arg, value);
      if (!n) return n.error();
      rate.requests = *n;
      have_rate = true;
    } else if (std::strcmp(arg, "--interval-ms") == 0) {
      auto n = parse_int(arg, value);
      if (!n) return n.error();
      rate.interval = std::chrono::milliseconds(*n);
      have_interval = true;
    } else if (std::strcmp(arg, "--burst") == 0) {
      auto n = parse_int(arg, value);
      if (!n) return n.error();
      rate.burst = *n;
    } else if (std::strcmp(arg, "--workers") == 0) {
      auto n = parse_int(arg, value);
      if (!n) return n.error();
      if (*n < 0) return unable_to_parse(arg);
      cfg.workers = static_cast<std::size_t>(*n);
    } else if (std::strcmp(arg, "--timeout") == 0) {
      auto n = parse_int(arg, value);
      if (!n) return n.error();
      cfg.timeout_sec = *n;
    } else if (std::strcmp(arg, "--user-agent") == 0) {
      cfg.user_agent = value;
    } else if (std::strcmp(arg, "--log-level") == 0) {
      cfg.log_level = value;
    } else {
      return Error{ErrorCode::UnableToParse, std::string("unknown option ") + arg};
    }
  }

  if (have_rate != have_interval)
    return missing_rate_limit_field(have_rate ? "--interval-ms" : "--rate");
  if (have_rate) cfg.rate_limit = rate;

  if (auto err = validate(cfg)) return *err;
  return cfg;
}

MaybeError validate(const Config& cfg) {
  if (cfg.requests.empty()) return Error{ErrorCode::NoRequests, "no requests defined"};
  for (const auto& spec : cfg.requests) {
    if (spec.request.url.empty()) return missing_config_field("url");
  }
  if (cfg.rate_limit) {
    const auto& r = *cfg.rate_limit;
    if (auto err = check_rate_limit(r.requests, r.interval, r.burst)) return err;
  }
  if (cfg.timeout_sec <= 0) return unable_to_parse("--timeout");
  if (!valid_log_level(cfg.log_level)) return unable_to_parse("--log-level");
  return std::nullopt;
}

std::string usage(const char* prog) {
  std::ostringstream out;
  out << "Usage: " << prog << " [options]\n"
      << "  --url URL          Request to fetch (repeatable)\n"
      << "  --table NAME       Destination table for the previous --url (default: URL path without '/')\n"
      << "  --database NAME    Destination database/schema for the previous --url\n"
      << "  --method M         HTTP method for the previous --url (default: GET)\n"
      << "  --header 'K: V'    Header for the previous --url (repeatable)\n"
      << "  --storage DSN      postgres://..., postgresql://... or memory:// (repeatable)\n"
      << "  --rate N           Requests per interval (requires --interval-ms)\n"
      << "  --interval-ms MS   Rate limit interval\n"
      << "  --burst B          Rate limit burst (default: 1)\n"
      << "  --workers N        Workers per stage (default: one per core)\n"
      << "  --timeout S        Per-request timeout in seconds (default: 30)\n"
      << "  --user-agent UA    User agent (default: siphon/1.0)\n"
      << "  --truncate         Truncate destination tables before the run\n"
      << "  --log-level L      trace, debug, info, warn, error, critical, off (default: info)\n";
  return out.str();
}

}  // namespace siphon
