#include "banana/config/config.hpp"
#include "banana/config/toml_util.hpp"

#include "banana/job/job.hpp"
#include "banana/util/log.hpp"
#include "banana/util/url.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>

namespace banana {
namespace detail {

struct ApiToml {
  std::string key;
  std::string model{"gemini-3-pro-image-preview"};
  std::string base_url{"https://generativelanguage.googleapis.com/v1beta"};
  int timeout_sec{120};
};

struct DefaultsToml {
  std::string aspect_ratio{"1:1"};
  std::string size{"1K"};
  int num_images{1};
};

struct OutputToml {
  std::string directory{"./banana-output"};
};

struct DatabaseToml {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"banana"};
  std::string password{"banana"};
  std::string database{"banana"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5};
};

struct EngineToml {
  int max_concurrency{2};
  int max_attempts{3};
  int backoff_initial_ms{1000};
  int backoff_max_ms{30000};
  double backoff_multiplier{2.0};
  int attempt_timeout_sec{120};
  int recover_stale_after_sec{300};
};

struct LogToml {
  std::string level{"warn"};
  std::string file;
};

struct AppToml {
  ApiToml api{};
  DefaultsToml defaults{};
  OutputToml output{};
  DatabaseToml database{};
  EngineToml engine{};
  LogToml log{};
};

} // namespace detail
} // namespace banana

namespace glz {
template <> struct meta<banana::detail::ApiToml> {
  using T = banana::detail::ApiToml;
  static constexpr auto value =
      object("key", &T::key, "model", &T::model, "base_url", &T::base_url,
             "timeout_sec", &T::timeout_sec);
};

template <> struct meta<banana::detail::DefaultsToml> {
  using T = banana::detail::DefaultsToml;
  static constexpr auto value =
      object("aspect_ratio", &T::aspect_ratio, "size", &T::size, "num_images",
             &T::num_images);
};

template <> struct meta<banana::detail::OutputToml> {
  using T = banana::detail::OutputToml;
  static constexpr auto value = object("directory", &T::directory);
};

template <> struct meta<banana::detail::DatabaseToml> {
  using T = banana::detail::DatabaseToml;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<banana::detail::EngineToml> {
  using T = banana::detail::EngineToml;
  static constexpr auto value = object(
      "max_concurrency", &T::max_concurrency, "max_attempts",
      &T::max_attempts, "backoff_initial_ms", &T::backoff_initial_ms,
      "backoff_max_ms", &T::backoff_max_ms, "backoff_multiplier",
      &T::backoff_multiplier, "attempt_timeout_sec", &T::attempt_timeout_sec,
      "recover_stale_after_sec", &T::recover_stale_after_sec);
};

template <> struct meta<banana::detail::LogToml> {
  using T = banana::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<banana::detail::AppToml> {
  using T = banana::detail::AppToml;
  static constexpr auto value =
      object("api", &T::api, "defaults", &T::defaults, "output", &T::output,
             "database", &T::database, "engine", &T::engine, "log", &T::log);
};
} // namespace glz

namespace banana {
namespace {

[[nodiscard]] auto from_raw(detail::AppToml &&raw) -> AppConfig {
  AppConfig cfg{};
  cfg.api = {.key = std::move(raw.api.key),
             .model = std::move(raw.api.model),
             .base_url = std::move(raw.api.base_url),
             .timeout_sec = raw.api.timeout_sec};
  cfg.defaults = {.aspect_ratio = std::move(raw.defaults.aspect_ratio),
                  .size = std::move(raw.defaults.size),
                  .num_images = raw.defaults.num_images};
  cfg.output.directory = std::move(raw.output.directory);
  cfg.database = {.host = std::move(raw.database.host),
                  .port = raw.database.port,
                  .username = std::move(raw.database.username),
                  .password = std::move(raw.database.password),
                  .database = std::move(raw.database.database),
                  .pool_size = raw.database.pool_size,
                  .connect_timeout = raw.database.connect_timeout};
  cfg.engine = {.max_concurrency = raw.engine.max_concurrency,
                .max_attempts = raw.engine.max_attempts,
                .backoff_initial_ms = raw.engine.backoff_initial_ms,
                .backoff_max_ms = raw.engine.backoff_max_ms,
                .backoff_multiplier = raw.engine.backoff_multiplier,
                .attempt_timeout_sec = raw.engine.attempt_timeout_sec,
                .recover_stale_after_sec = raw.engine.recover_stale_after_sec};
  cfg.log = {.level = std::move(raw.log.level),
             .file = std::move(raw.log.file)};
  return cfg;
}

[[nodiscard]] auto to_raw(const AppConfig &cfg) -> detail::AppToml {
  detail::AppToml raw{};
  raw.api = {.key = cfg.api.key,
             .model = cfg.api.model,
             .base_url = cfg.api.base_url,
             .timeout_sec = cfg.api.timeout_sec};
  raw.defaults = {.aspect_ratio = cfg.defaults.aspect_ratio,
                  .size = cfg.defaults.size,
                  .num_images = cfg.defaults.num_images};
  raw.output.directory = cfg.output.directory;
  raw.database = {.host = cfg.database.host,
                  .port = cfg.database.port,
                  .username = cfg.database.username,
                  .password = cfg.database.password,
                  .database = cfg.database.database,
                  .pool_size = cfg.database.pool_size,
                  .connect_timeout = cfg.database.connect_timeout};
  raw.engine = {.max_concurrency = cfg.engine.max_concurrency,
                .max_attempts = cfg.engine.max_attempts,
                .backoff_initial_ms = cfg.engine.backoff_initial_ms,
                .backoff_max_ms = cfg.engine.backoff_max_ms,
                .backoff_multiplier = cfg.engine.backoff_multiplier,
                .attempt_timeout_sec = cfg.engine.attempt_timeout_sec,
                .recover_stale_after_sec = cfg.engine.recover_stale_after_sec};
  raw.log = {.level = cfg.log.level, .file = cfg.log.file};
  return raw;
}

template <typename T>
[[nodiscard]] auto parse_value(std::string_view text) -> Result<T> {
  try {
    return ok(boost::lexical_cast<T>(text));
  } catch (const boost::bad_lexical_cast &) {
    return fail(Error::InvalidArgument);
  }
}

template <typename T>
[[nodiscard]] auto env_override(const char *name, T &field) -> Result<void> {
  const char *v = std::getenv(name);
  if (v == nullptr || *v == '\0') {
    return ok();
  }
  if constexpr (std::is_same_v<T, std::string>) {
    field = v;
  } else {
    auto parsed = parse_value<T>(v);
    if (!parsed) {
      log::error("Invalid value for {}: '{}'", name, v);
      return fail(Error::ParseError);
    }
    field = *parsed;
  }
  return ok();
}

[[nodiscard]] auto is_known_log_level(std::string_view name) -> bool {
  return std::ranges::find(log::level_names, name) != log::level_names.end();
}

using Getter = std::string (*)(const AppConfig &);
using Setter = Result<void> (*)(AppConfig &, std::string_view);

struct KeySpec {
  std::string_view key;
  Getter get;
  Setter set;
};

template <typename T>
[[nodiscard]] auto assign(T &field, std::string_view text) -> Result<void> {
  if constexpr (std::is_same_v<T, std::string>) {
    field = std::string(text);
    return ok();
  } else {
    auto parsed = parse_value<T>(text);
    if (!parsed) {
      return fail(parsed.error());
    }
    field = *parsed;
    return ok();
  }
}

template <typename T> [[nodiscard]] auto to_text(const T &field) -> std::string {
  if constexpr (std::is_same_v<T, std::string>) {
    return field;
  } else {
    return boost::lexical_cast<std::string>(field);
  }
}

#define BANANA_CONFIG_KEY(name, member)                                        \
  KeySpec {                                                                    \
    name,                                                                      \
        [](const AppConfig &c) -> std::string { return to_text(c.member); },  \
        [](AppConfig &c, std::string_view v) -> Result<void> {                 \
          return assign(c.member, v);                                          \
        }                                                                      \
  }

const std::array kKeySpecs = {
    BANANA_CONFIG_KEY("api.key", api.key),
    BANANA_CONFIG_KEY("api.model", api.model),
    BANANA_CONFIG_KEY("api.base_url", api.base_url),
    BANANA_CONFIG_KEY("api.timeout_sec", api.timeout_sec),
    BANANA_CONFIG_KEY("defaults.aspect_ratio", defaults.aspect_ratio),
    BANANA_CONFIG_KEY("defaults.size", defaults.size),
    BANANA_CONFIG_KEY("defaults.num_images", defaults.num_images),
    BANANA_CONFIG_KEY("output.directory", output.directory),
    BANANA_CONFIG_KEY("database.host", database.host),
    BANANA_CONFIG_KEY("database.port", database.port),
    BANANA_CONFIG_KEY("database.username", database.username),
    BANANA_CONFIG_KEY("database.password", database.password),
    BANANA_CONFIG_KEY("database.database", database.database),
    BANANA_CONFIG_KEY("database.pool_size", database.pool_size),
    BANANA_CONFIG_KEY("database.connect_timeout", database.connect_timeout),
    BANANA_CONFIG_KEY("engine.max_concurrency", engine.max_concurrency),
    BANANA_CONFIG_KEY("engine.max_attempts", engine.max_attempts),
    BANANA_CONFIG_KEY("engine.backoff_initial_ms", engine.backoff_initial_ms),
    BANANA_CONFIG_KEY("engine.backoff_max_ms", engine.backoff_max_ms),
    BANANA_CONFIG_KEY("engine.backoff_multiplier", engine.backoff_multiplier),
    BANANA_CONFIG_KEY("engine.attempt_timeout_sec",
                      engine.attempt_timeout_sec),
    BANANA_CONFIG_KEY("engine.recover_stale_after_sec",
                      engine.recover_stale_after_sec),
    BANANA_CONFIG_KEY("log.level", log.level),
    BANANA_CONFIG_KEY("log.file", log.file),
};

#undef BANANA_CONFIG_KEY

const auto kKeyNames = [] {
  std::array<std::string_view, kKeySpecs.size()> out{};
  std::ranges::transform(kKeySpecs, out.begin(),
                         [](const KeySpec &s) { return s.key; });
  return out;
}();

[[nodiscard]] auto find_key(std::string_view key) -> const KeySpec * {
  const auto *it = std::ranges::find(kKeySpecs, key, &KeySpec::key);
  return it == kKeySpecs.end() ? nullptr : it;
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<AppConfig> {
  auto raw_result = toml_util::parse_toml<detail::AppToml>(toml_text);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto cfg = from_raw(std::move(*raw_result));
  if (auto v = validate_config(cfg); !v) {
    return fail(v.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto apply_env_overrides(AppConfig &cfg) -> Result<void> {
  // GEMINI_API_KEY is the conventional name; BANANA_API_KEY wins if both set.
  std::array<Result<void>, 15> results = {
      env_override("GEMINI_API_KEY", cfg.api.key),
      env_override("BANANA_API_KEY", cfg.api.key),
      env_override("BANANA_MODEL", cfg.api.model),
      env_override("BANANA_OUTPUT_DIR", cfg.output.directory),
      env_override("BANANA_DB_HOST", cfg.database.host),
      env_override("BANANA_DB_PORT", cfg.database.port),
      env_override("BANANA_DB_USERNAME", cfg.database.username),
      env_override("BANANA_DB_PASSWORD", cfg.database.password),
      env_override("BANANA_DB_DATABASE", cfg.database.database),
      env_override("BANANA_DB_POOL_SIZE", cfg.database.pool_size),
      env_override("BANANA_DB_CONNECT_TIMEOUT", cfg.database.connect_timeout),
      env_override("BANANA_MAX_CONCURRENCY", cfg.engine.max_concurrency),
      env_override("BANANA_MAX_ATTEMPTS", cfg.engine.max_attempts),
      env_override("BANANA_LOG_LEVEL", cfg.log.level),
      env_override("BANANA_LOG_FILE", cfg.log.file),
  };
  for (auto &r : results) {
    if (!r) {
      return r;
    }
  }
  return ok();
}

auto validate_config(const AppConfig &cfg) -> Result<void> {
  const auto &e = cfg.engine;
  if (cfg.api.timeout_sec <= 0 || e.max_concurrency <= 0 ||
      e.max_attempts <= 0 || e.backoff_initial_ms <= 0 ||
      e.backoff_max_ms < e.backoff_initial_ms || e.backoff_multiplier < 1.0 ||
      e.attempt_timeout_sec <= 0 || e.recover_stale_after_sec <= 0) {
    log::error("Invalid engine configuration");
    return fail(Error::ParseError);
  }
  if (!is_supported_model(cfg.api.model)) {
    log::error("Unsupported model '{}'", cfg.api.model);
    return fail(Error::ParseError);
  }
  if (!util::parse_base_url(cfg.api.base_url)) {
    log::error("Invalid api.base_url '{}'", cfg.api.base_url);
    return fail(Error::ParseError);
  }
  if (!is_supported_aspect_ratio(cfg.defaults.aspect_ratio) ||
      !is_supported_size(cfg.defaults.size) ||
      cfg.defaults.num_images < kMinImages ||
      cfg.defaults.num_images > kMaxImages) {
    log::error("Invalid [defaults] section");
    return fail(Error::ParseError);
  }
  if (cfg.output.directory.empty()) {
    log::error("output.directory must not be empty");
    return fail(Error::ParseError);
  }
  if (cfg.database.pool_size == 0 || cfg.database.port == 0) {
    log::error("Invalid [database] section");
    return fail(Error::ParseError);
  }
  if (!is_known_log_level(cfg.log.level)) {
    log::error("Unknown log level '{}'", cfg.log.level);
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load(const std::filesystem::path &path)
    -> Result<AppConfig> {
  AppConfig cfg{};
  if (auto file_cfg = load_from_file(path); file_cfg) {
    cfg = std::move(*file_cfg);
  } else if (file_cfg.error() == make_error_code(Error::FileNotFound)) {
    log::debug("No config at {}, using defaults", path.string());
  } else {
    return fail(file_cfg.error());
  }

  if (auto r = apply_env_overrides(cfg); !r) {
    return fail(r.error());
  }
  if (auto r = validate_config(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

auto ConfigLoader::load_from_file(const std::filesystem::path &path)
    -> Result<AppConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<AppConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::default_config_path() -> std::filesystem::path {
  if (const char *v = std::getenv("BANANA_CONFIG"); v != nullptr && *v) {
    return v;
  }
  if (const char *v = std::getenv("XDG_CONFIG_HOME"); v != nullptr && *v) {
    return std::filesystem::path(v) / "banana" / "config.toml";
  }
  if (const char *v = std::getenv("HOME"); v != nullptr && *v) {
    return std::filesystem::path(v) / ".config" / "banana" / "config.toml";
  }
  return std::filesystem::path("banana.toml");
}

auto to_toml(const AppConfig &cfg) -> Result<std::string> {
  return toml_util::dump_toml(to_raw(cfg));
}

auto save_config(const AppConfig &cfg, const std::filesystem::path &path)
    -> Result<void> {
  auto text = to_toml(cfg);
  if (!text) {
    return fail(text.error());
  }
  return toml_util::write_file(path, *text);
}

auto config_keys() -> std::span<const std::string_view> { return kKeyNames; }

auto config_get(const AppConfig &cfg, std::string_view key, bool reveal)
    -> Result<std::string> {
  const auto *spec = find_key(key);
  if (spec == nullptr) {
    return fail(Error::NotFound);
  }
  auto value = spec->get(cfg);
  if (!reveal && is_secret_key(key)) {
    return ok(mask_secret(value));
  }
  return ok(std::move(value));
}

auto config_set(AppConfig &cfg, std::string_view key, std::string_view value)
    -> Result<void> {
  const auto *spec = find_key(key);
  if (spec == nullptr) {
    return fail(Error::NotFound);
  }
  auto candidate = cfg;
  if (auto r = spec->set(candidate, value); !r) {
    return fail(Error::InvalidArgument);
  }
  if (auto r = validate_config(candidate); !r) {
    return fail(Error::InvalidArgument);
  }
  cfg = std::move(candidate);
  return ok();
}

auto is_secret_key(std::string_view key) noexcept -> bool {
  return key == "api.key" || key == "database.password";
}

auto mask_secret(std::string_view value) -> std::string {
  if (value.empty()) {
    return "(not set)";
  }
  return "****";
}

} // namespace banana
