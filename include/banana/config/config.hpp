#pragma once

#include "banana/config/app_config.hpp"
#include "banana/core/error.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace banana {

class ConfigLoader {
public:
  /// File values, then environment overrides, then validation. A missing
  /// file is not an error: the defaults are used.
  [[nodiscard]] static auto load(const std::filesystem::path &path)
      -> Result<AppConfig>;

  /// File values only; FileNotFound if the file is absent.
  [[nodiscard]] static auto load_from_file(const std::filesystem::path &path)
      -> Result<AppConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<AppConfig>;

  /// $BANANA_CONFIG, else $XDG_CONFIG_HOME/banana/config.toml, else
  /// ~/.config/banana/config.toml.
  [[nodiscard]] static auto default_config_path() -> std::filesystem::path;
};

[[nodiscard]] auto apply_env_overrides(AppConfig &cfg) -> Result<void>;
[[nodiscard]] auto validate_config(const AppConfig &cfg) -> Result<void>;

[[nodiscard]] auto to_toml(const AppConfig &cfg) -> Result<std::string>;
[[nodiscard]] auto save_config(const AppConfig &cfg,
                               const std::filesystem::path &path)
    -> Result<void>;

/// Dotted keys accepted by config_get / config_set ("engine.max_attempts").
[[nodiscard]] auto config_keys() -> std::span<const std::string_view>;

/// NotFound for unknown keys. Secrets are masked unless `reveal` is set.
[[nodiscard]] auto config_get(const AppConfig &cfg, std::string_view key,
                              bool reveal = false) -> Result<std::string>;

/// Parses `value` for `key` and validates the result. `cfg` is left
/// unchanged on failure.
[[nodiscard]] auto config_set(AppConfig &cfg, std::string_view key,
                              std::string_view value) -> Result<void>;

[[nodiscard]] auto is_secret_key(std::string_view key) noexcept -> bool;
[[nodiscard]] auto mask_secret(std::string_view value) -> std::string;

} // namespace banana
