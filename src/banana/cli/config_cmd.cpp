#include "banana/cli/commands.hpp"
#include "banana/cli/session.hpp"
#include "banana/config/config.hpp"
#include "banana/util/log.hpp"

#include <print>

namespace banana::cli {

namespace {

/// The file's own values (no environment), or defaults if it does not exist.
auto load_file_config(const std::filesystem::path &path) -> Result<AppConfig> {
  auto cfg = ConfigLoader::load_from_file(path);
  if (!cfg && cfg.error() == make_error_code(Error::FileNotFound)) {
    return ok(AppConfig{});
  }
  return cfg;
}

auto masked(AppConfig cfg) -> AppConfig {
  if (!cfg.api.key.empty()) {
    cfg.api.key = mask_secret(cfg.api.key);
  }
  if (!cfg.database.password.empty()) {
    cfg.database.password = mask_secret(cfg.database.password);
  }
  return cfg;
}

} // namespace

auto cmd_config_show(const ConfigOptions &opts) -> int {
  auto cfg = load_config_or_print(opts.common);
  if (!cfg) {
    return 1;
  }
  auto text = to_toml(opts.reveal ? *cfg : masked(*cfg));
  if (!text) {
    std::println(stderr, "Error: {}", text.error().message());
    return 1;
  }
  std::println("# {}", resolve_config_path(opts.common).string());
  std::print("{}", *text);
  return 0;
}

auto cmd_config_get(const ConfigOptions &opts) -> int {
  auto cfg = load_config_or_print(opts.common);
  if (!cfg) {
    return 1;
  }
  auto value = config_get(*cfg, opts.key, opts.reveal);
  if (!value) {
    std::println(stderr, "Error: unknown key '{}'", opts.key);
    std::println(stderr, "Known keys:");
    for (auto key : config_keys()) {
      std::println(stderr, "  {}", key);
    }
    return 1;
  }
  std::println("{}", *value);
  return 0;
}

auto cmd_config_set(const ConfigOptions &opts) -> int {
  const auto path = resolve_config_path(opts.common);
  auto cfg = load_file_config(path);
  if (!cfg) {
    std::println(stderr, "Error: cannot read '{}': {}", path.string(),
                 cfg.error().message());
    return 1;
  }
  if (auto r = config_set(*cfg, opts.key, opts.value); !r) {
    if (r.error() == make_error_code(Error::NotFound)) {
      std::println(stderr, "Error: unknown key '{}'", opts.key);
    } else {
      std::println(stderr, "Error: invalid value '{}' for {}", opts.value,
                   opts.key);
    }
    return 1;
  }
  if (auto r = save_config(*cfg, path); !r) {
    std::println(stderr, "Error: cannot write '{}': {}", path.string(),
                 r.error().message());
    return 1;
  }
  const auto shown = is_secret_key(opts.key) ? mask_secret(opts.value)
                                             : opts.value;
  std::println("{} = {}", opts.key, shown);
  return 0;
}

auto cmd_config_path(const ConfigOptions &opts) -> int {
  const auto path = resolve_config_path(opts.common);
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  std::println("{}{}", path.string(), exists ? "" : " (not created yet)");
  return 0;
}

auto cmd_config_reset(const ConfigOptions &opts) -> int {
  const auto path = resolve_config_path(opts.common);
  if (!opts.force) {
    std::println(stderr,
                 "This replaces {} with defaults. Re-run with --force.",
                 path.string());
    return 1;
  }
  if (auto r = save_config(AppConfig{}, path); !r) {
    std::println(stderr, "Error: cannot write '{}': {}", path.string(),
                 r.error().message());
    return 1;
  }
  std::println("Reset {}", path.string());
  return 0;
}

} // namespace banana::cli
