#pragma once

#include <cstdint>
#include <string>

namespace banana {

struct ApiConfig {
  std::string key;
  std::string model{"gemini-3-pro-image-preview"};
  std::string base_url{"https://generativelanguage.googleapis.com/v1beta"};
  int timeout_sec{120};

  auto operator==(const ApiConfig &) const -> bool = default;
};

struct DefaultsConfig {
  std::string aspect_ratio{"1:1"};
  std::string size{"1K"};
  int num_images{1};

  auto operator==(const DefaultsConfig &) const -> bool = default;
};

struct OutputConfig {
  std::string directory{"./banana-output"};

  auto operator==(const OutputConfig &) const -> bool = default;
};

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"banana"};
  std::string password{"banana"};
  std::string database{"banana"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct EngineConfig {
  int max_concurrency{2};
  int max_attempts{3};
  int backoff_initial_ms{1000};
  int backoff_max_ms{30000};
  double backoff_multiplier{2.0};
  int attempt_timeout_sec{120};
  // Running jobs untouched for this long are assumed orphaned by a dead
  // process and resumed by recovery.
  int recover_stale_after_sec{300};

  auto operator==(const EngineConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"warn"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct AppConfig {
  ApiConfig api;
  DefaultsConfig defaults;
  OutputConfig output;
  DatabaseConfig database;
  EngineConfig engine;
  LogConfig log;

  auto operator==(const AppConfig &) const -> bool = default;
};

} // namespace banana
