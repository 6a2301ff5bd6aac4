#include "banana/cli/commands.hpp"
#include "banana/cli/formatting.hpp"
#include "banana/cli/session.hpp"
#include "banana/util/signal.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <thread>

namespace banana::cli {

namespace {

constexpr auto kTick = std::chrono::milliseconds{50};
constexpr int kMinIntervalMs = 100;

auto render_frame(Session &session, const JobFilter &filter)
    -> Result<std::string> {
  auto jobs = session.query().list_blocking(filter);
  if (!jobs) {
    return fail(jobs.error());
  }
  auto counts = session.query().status_counts_blocking();
  if (!counts) {
    return fail(counts.error());
  }

  std::string out = fmt::ansi::bold("banana jobs");
  out += fmt::ansi::dim("  (Ctrl-C to quit)\n\n");
  if (jobs->empty()) {
    out += "No jobs yet.\n";
  } else {
    const auto table = fmt::job_table();
    out += table.render_header();
    for (const auto &job : *jobs) {
      out += table.render_row(fmt::job_row(job));
    }
  }
  out += std::format("\n{} queued  {} running  {} completed  {} failed  "
                     "({} total)\n",
                     counts->queued, fmt::ansi::yellow(std::format(
                                         "{}", counts->running)),
                     fmt::ansi::green(std::format("{}", counts->completed)),
                     fmt::ansi::red(std::format("{}", counts->failed)),
                     counts->total());
  return ok(std::move(out));
}

} // namespace

auto cmd_watch(const WatchOptions &opts) -> int {
  std::optional<JobStatus> status;
  if (!opts.status.empty()) {
    status = util::try_parse_enum<JobStatus>(opts.status);
    if (!status) {
      std::println(stderr, "Error: unknown status '{}'", opts.status);
      return 1;
    }
  }

  auto config_res = load_config_or_print(opts.common);
  if (!config_res) {
    return 1;
  }
  auto session_res =
      Session::open(std::move(*config_res), opts.resume
                                                ? Session::Mode::Worker
                                                : Session::Mode::QueryOnly);
  if (!session_res) {
    std::println(stderr, "Error: {}", session_res.error().message());
    return 1;
  }
  auto &session = **session_res;

  // Engine notifications redraw at once; the interval catches changes made
  // by other processes.
  std::atomic<bool> dirty{true};
  std::optional<SubscriptionId> sub;
  if (auto *engine = session.engine()) {
    sub = engine->subscribe([&dirty](const JobEvent &) {
      dirty.store(true, std::memory_order_release);
    });
  }

  const auto interval =
      std::chrono::milliseconds{std::max(opts.interval_ms, kMinIntervalMs)};
  const JobFilter filter{.status = status, .limit = opts.limit};
  const bool redraw_in_place = fmt::ansi::is_tty() && !opts.once;

  install_interrupt_handlers();
  std::string last_frame;
  auto last_render = std::chrono::steady_clock::time_point{};
  int rc = 0;
  while (!interrupt_requested()) {
    const auto now = std::chrono::steady_clock::now();
    if (dirty.exchange(false, std::memory_order_acq_rel) ||
        now - last_render >= interval) {
      auto frame = render_frame(session, filter);
      if (!frame) {
        std::println(stderr, "Error: {}", frame.error().message());
        rc = 1;
        break;
      }
      if (*frame != last_frame) {
        if (redraw_in_place) {
          std::print("{}", fmt::ansi::kClearScreen);
        }
        std::print("{}", *frame);
        std::fflush(stdout);
        last_frame = std::move(*frame);
      }
      last_render = now;
      if (opts.once) {
        break;
      }
    }
    std::this_thread::sleep_for(kTick);
  }

  if (sub) {
    session.engine()->unsubscribe(*sub);
  }
  return rc;
}

} // namespace banana::cli
