#include "banana/core/runtime.hpp"

#include "banana/util/log.hpp"

#include <algorithm>
#include <exception>

namespace banana {
namespace {

thread_local const Runtime *t_current_runtime = nullptr;

[[nodiscard]] auto resolve_thread_count(unsigned requested) -> unsigned {
  if (requested > 0) {
    return requested;
  }
  return std::clamp(std::thread::hardware_concurrency(), 2U, 8U);
}

} // namespace

Runtime::Runtime(unsigned threads)
    : thread_count_(resolve_thread_count(threads)),
      ctx_(static_cast<int>(thread_count_)) {}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return ok();
  }

  ctx_.restart();
  work_.emplace(boost::asio::make_work_guard(ctx_));
  threads_.reserve(thread_count_);
  for (unsigned i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this] {
      t_current_runtime = this;
      for (;;) {
        try {
          ctx_.run();
          break;
        } catch (const std::exception &e) {
          log::error("Runtime worker caught exception: {}", e.what());
        }
      }
      t_current_runtime = nullptr;
    });
  }
  log::debug("Runtime started with {} worker threads", thread_count_);
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  work_.reset();
  ctx_.stop();
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::in_runtime_thread() const noexcept -> bool {
  return t_current_runtime == this;
}

} // namespace banana
