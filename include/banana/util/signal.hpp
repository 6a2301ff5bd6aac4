#pragma once

namespace banana {

/// Routes SIGINT/SIGTERM to interrupt_requested() and ignores SIGPIPE.
void install_interrupt_handlers();

[[nodiscard]] auto interrupt_requested() noexcept -> bool;

} // namespace banana
