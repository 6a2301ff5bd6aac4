#include "banana/util/signal.hpp"

#include <atomic>
#include <csignal>

namespace banana {

namespace {
std::atomic<bool> g_interrupted{false};

extern "C" void interrupt_handler(int /*signal*/) {
  g_interrupted.store(true, std::memory_order_release);
}
} // namespace

void install_interrupt_handlers() {
  std::signal(SIGINT, interrupt_handler);
  std::signal(SIGTERM, interrupt_handler);
  std::signal(SIGPIPE, SIG_IGN);
}

auto interrupt_requested() noexcept -> bool {
  return g_interrupted.load(std::memory_order_acquire);
}

} // namespace banana
