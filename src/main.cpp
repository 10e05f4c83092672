#include "app/Config.hpp"
#include "app/Dashboard.hpp"
#include "app/Scheduler.hpp"
#include "data/GenerationApi.hpp"
#include "net/CurlTransport.hpp"
#include "net/Fetcher.hpp"
#include "ui/Input.hpp"
#include "ui/Terminal.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

using namespace windwatch;

static const char* kUsage =
    "Usage: windwatch [--config PATH] [--iterations N] [-h|--help]\n"
    "Live wind power generation in Finland. Press Esc or q to quit.\n";

struct CliOptions {
  std::optional<std::string> config_path;
  int iterations{0};  // 0 => run until cancelled
};

// Returns false on an invalid argument.
static bool parse_args(int argc, char** argv, CliOptions& opts, bool& help) {
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-h" || a == "--help") { help = true; return true; }
    if (a == "--config" && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (a == "--iterations" && i + 1 < argc) {
      std::string_view v = argv[++i];
      int n = 0;
      auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
      if (ec != std::errc() || ptr != v.data() + v.size() || n < 0) {
        std::fprintf(stderr, "windwatch: invalid --iterations value '%s'\n", argv[i]);
        return false;
      }
      opts.iterations = n;
    } else {
      std::fprintf(stderr, "windwatch: unknown argument '%s'\n", argv[i]);
      return false;
    }
  }
  return true;
}

static void print_error(const std::exception& e, bool top) {
  std::string red = ui::sgr_fg_red(STDERR_FILENO);
  std::string reset = ui::sgr_reset(STDERR_FILENO);
  if (top) std::fprintf(stderr, "%swindwatch: unhandled error: %s%s\n", red.c_str(), e.what(), reset.c_str());
  else std::fprintf(stderr, "%s  caused by: %s%s\n", red.c_str(), e.what(), reset.c_str());
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& inner) {
    print_error(inner, false);
  }
}

// Terminal guards and the key listener live here so they are unwound before main reports an error.
static void run_dashboard(data::GenerationApi& api, float historical_max, int iterations,
                          std::stop_source cancel) {
  ui::RawTermGuard raw;
  ui::CursorGuard cursor;
  std::atexit(ui::on_atexit_restore);

  app::Dashboard dashboard(api, historical_max, [](std::string_view frame){
    ui::best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
  });

  ui::KeyListener keys(cancel);
  keys.start();

  app::Scheduler scheduler(dashboard, cancel.get_token(), iterations);
  scheduler.run();

  bool cancelled = cancel.stop_requested();
  keys.stop();
  if (cancelled) ui::clear_screen();
}

int main(int argc, char** argv) {
  CliOptions opts;
  bool help = false;
  if (!parse_args(argc, argv, opts, help)) {
    std::fputs(kUsage, stderr);
    return 2;
  }
  if (help) {
    std::fputs(kUsage, stdout);
    return 0;
  }

  std::signal(SIGINT, ui::on_sigint);

  try {
    app::AppConfig cfg = app::load_config(opts.config_path);
    net::CurlTransport transport(std::chrono::seconds(cfg.timeout_s));
    // Shared with the Fetcher so a rate-limit wait ends as soon as the user quits.
    std::stop_source cancel;
    net::Fetcher fetcher(transport, cfg.api_key, {}, net::Fetcher::kMaxRetries, cancel.get_token());
    data::GenerationApi api(fetcher, cfg.endpoints);

    float historical_max = api.historical_max(std::chrono::system_clock::now());
    run_dashboard(api, historical_max, opts.iterations, cancel);
  } catch (const std::exception& e) {
    print_error(e, true);
    return 1;
  }
  return 0;
}
