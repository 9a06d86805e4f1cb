#include "config.hpp"
#include "engine.hpp"
#include "fetcher.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

static std::atomic<bool> g_running{true};

static void on_signal(int) { g_running = false; }

int main(int argc, char* argv[]) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("siphon"));

  auto cfg = siphon::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << argv[0] << ": " << cfg.error().message << "\n" << siphon::usage(argv[0]);
    return 2;
  }
  if (cfg->help) {
    std::cerr << siphon::usage(argv[0]);
    return 0;
  }
  spdlog::set_level(spdlog::level::from_str(cfg->log_level));

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::vector<std::shared_ptr<siphon::Storage>> storages;
  for (const auto& dsn : cfg->storage) {
    auto stg = siphon::open_storage(dsn);
    if (!stg) {
      spdlog::error("{}", stg.error().message);
      return 1;
    }
    storages.emplace_back(std::move(stg).value());
  }

  siphon::Context ctx;

  if (cfg->truncate) {
    std::vector<siphon::TableRef> tables;
    for (const auto& spec : cfg->requests) tables.push_back(siphon::destination(spec));
    for (auto& stg : storages) {
      if (auto err = stg->truncate(ctx, tables)) {
        spdlog::error("truncate: {}", err->message);
        return 1;
      }
    }
  }

  siphon::CurlOptions curl_opts;
  curl_opts.timeout_sec = cfg->timeout_sec;
  curl_opts.user_agent = cfg->user_agent;

  siphon::Engine engine;
  engine.client(std::make_shared<siphon::CurlClient>(curl_opts))
      .requests(cfg->requests)
      .upsert_writers(storages)
      .workers(cfg->workers);
  if (cfg->rate_limit) {
    const auto& r = *cfg->rate_limit;
    engine.rate_limiter(std::make_shared<siphon::TokenBucket>(r.requests, r.interval, r.burst));
  }

  // Signal handlers only flip a flag; this thread turns it into cancellation.
  std::atomic<bool> finished{false};
  std::thread watcher([&] {
    while (!finished) {
      if (!g_running) {
        spdlog::warn("interrupted, cancelling run");
        ctx.cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  auto err = engine.run(ctx);
  finished = true;
  watcher.join();

  for (auto& stg : storages) {
    if (auto cerr = stg->close()) spdlog::warn("close {}: {}", stg->type(), cerr->message);
  }

  if (err) {
    spdlog::error("{} ({} error)", err->message, siphon::error_category(err->code));
    return 1;
  }
  return 0;
}
