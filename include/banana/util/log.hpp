#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace banana::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m",
    "\o{33}[33m", "\o{33}[31m", "\o{33}[0m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name,
                                      Level fallback = Level::Info) -> Level {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return fallback;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Lines are formatted on the calling thread and handed to a single writer
// thread through a concurrent_channel. Before start() (and after stop()) the
// logger writes synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

public:
  Logger() = default;
  ~Logger() {
    stop();
    close_file();
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    std::scoped_lock lock(lifecycle_mu_);
    if (channel_) {
      return;
    }
    writer_ctx_.restart();
    channel_ =
        std::make_shared<LogChannel>(writer_ctx_.get_executor(), kQueueCapacity);
    writer_ = std::jthread([this, ch = channel_] { drain(ch); });
  }

  auto stop() -> void {
    std::shared_ptr<LogChannel> ch;
    {
      std::scoped_lock lock(lifecycle_mu_);
      ch = std::exchange(channel_, nullptr);
    }
    if (!ch) {
      return;
    }
    ch->close();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(out_mu_);
    close_file_locked();
    out_ = stderr;
  }

  auto set_output_file(std::string_view path) -> bool {
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    std::scoped_lock lock(out_mu_);
    close_file_locked();
    file_ = f;
    out_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line = format_line(level, std::format(fmt, std::forward<Args>(args)...));

    std::shared_ptr<LogChannel> ch;
    {
      std::scoped_lock lock(lifecycle_mu_);
      ch = channel_;
    }
    if (ch && ch->try_send(boost::system::error_code{}, line)) {
      return;
    }
    // Not started, or the queue is full: write inline.
    write(line);
  }

private:
  [[nodiscard]] static auto format_line(Level level, std::string_view msg)
      -> std::string {
    auto now = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", now,
                       level_colors.at(std::to_underlying(level)),
                       level_name(level), tid, msg);
  }

  auto write(std::string_view line) -> void {
    std::scoped_lock lock(out_mu_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }

  auto drain(std::shared_ptr<LogChannel> ch) -> void {
    for (;;) {
      bool closed = false;
      ch->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (ec) {
              closed = true;
              return;
            }
            write(line);
          });
      writer_ctx_.restart();
      (void)writer_ctx_.run_one();
      if (closed) {
        break;
      }
    }
    // Anything queued between close() and the last receive.
    while (ch->try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            write(line);
          }
        })) {
    }
  }

  auto close_file() -> void {
    std::scoped_lock lock(out_mu_);
    close_file_locked();
  }

  auto close_file_locked() -> void {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
      out_ = stderr;
    }
  }

  std::atomic<Level> level_{Level::Info};
  std::mutex lifecycle_mu_;
  std::mutex out_mu_;
  FILE *out_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context writer_ctx_{1};
  std::shared_ptr<LogChannel> channel_;
  std::jthread writer_;
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace banana::log
