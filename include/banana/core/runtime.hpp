#pragma once

#include "banana/core/asio_awaitable.hpp"
#include "banana/core/coroutine.hpp"
#include "banana/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

namespace banana {

// Owns the io_context that drives jobs and database I/O, and the threads
// that run it. Coroutines spawned here may run on any worker thread; callers
// needing serialisation wrap them in a strand.
class Runtime {
public:
  explicit Runtime(unsigned threads = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto executor() -> boost::asio::any_io_executor {
    return ctx_.get_executor();
  }

  [[nodiscard]] auto thread_count() const noexcept -> unsigned {
    return thread_count_;
  }

  /// True when called from one of this runtime's worker threads.
  [[nodiscard]] auto in_runtime_thread() const noexcept -> bool;

  /// Run `op` on the runtime and block the calling thread for its result.
  /// Must not be called from a runtime thread.
  template <typename T> [[nodiscard]] auto block_on(task<T> op) -> T {
    auto fut = co_spawn(ctx_, std::move(op), boost::asio::use_future);
    return fut.get();
  }

private:
  unsigned thread_count_;
  boost::asio::io_context ctx_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_;
  std::vector<std::jthread> threads_;
  std::atomic<bool> running_{false};
};

/// Suspends the calling coroutine; a cancelled wait returns early.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> spawn_task {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  timer.expires_after(duration);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  (void)ec;
}

} // namespace banana
