#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>

namespace banana {

// Exponential delay between retry attempts:
//   delay(n) = min(initial * multiplier^(n-1), max) scaled by 1 +/- jitter
// where n is the attempt that just failed (1-based).
class RetryBackoff {
public:
  struct Config {
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max{30000};
    double multiplier{2.0};
    double jitter{0.2};
  };

  RetryBackoff() = default;
  explicit RetryBackoff(Config cfg) : cfg_(cfg) {}

  [[nodiscard]] auto base_delay(int failed_attempt) const
      -> std::chrono::milliseconds {
    const int exponent = std::max(0, failed_attempt - 1);
    const double raw = static_cast<double>(cfg_.initial.count()) *
                       std::pow(cfg_.multiplier, exponent);
    const double capped =
        std::min(raw, static_cast<double>(cfg_.max.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
  }

  [[nodiscard]] auto delay(int failed_attempt) const
      -> std::chrono::milliseconds {
    auto base = base_delay(failed_attempt);
    if (cfg_.jitter <= 0.0 || base.count() == 0) {
      return base;
    }
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<double> dis(1.0 - cfg_.jitter,
                                               1.0 + cfg_.jitter);
    return std::chrono::milliseconds{static_cast<std::int64_t>(
        static_cast<double>(base.count()) * dis(gen))};
  }

  [[nodiscard]] auto config() const noexcept -> const Config & { return cfg_; }

private:
  Config cfg_;
};

} // namespace banana
