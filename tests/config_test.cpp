#include "banana/config/config.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdlib>
#include <fstream>

using namespace banana;
using namespace banana::test;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
};

} // namespace

TEST(ConfigTest, Defaults) {
  AppConfig cfg;
  EXPECT_EQ(cfg.api.model, "gemini-3-pro-image-preview");
  EXPECT_EQ(cfg.defaults.aspect_ratio, "1:1");
  EXPECT_EQ(cfg.defaults.size, "1K");
  EXPECT_EQ(cfg.output.directory, "./banana-output");
  EXPECT_EQ(cfg.engine.max_concurrency, 2);
  EXPECT_EQ(cfg.engine.max_attempts, 3);
  EXPECT_EQ(cfg.database.port, 3306);
  EXPECT_TRUE(validate_config(cfg).has_value());
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[api]
key = "secret"
model = "gemini-2.5-flash-image"

[defaults]
aspect_ratio = "16:9"
size = "2K"
num_images = 2

[output]
directory = "/tmp/images"

[engine]
max_concurrency = 4
max_attempts = 5
backoff_initial_ms = 500

[log]
level = "debug"
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->api.key, "secret");
  EXPECT_EQ(result->api.model, "gemini-2.5-flash-image");
  EXPECT_EQ(result->defaults.aspect_ratio, "16:9");
  EXPECT_EQ(result->defaults.num_images, 2);
  EXPECT_EQ(result->output.directory, "/tmp/images");
  EXPECT_EQ(result->engine.max_concurrency, 4);
  EXPECT_EQ(result->engine.max_attempts, 5);
  EXPECT_EQ(result->engine.backoff_initial_ms, 500);
  EXPECT_EQ(result->engine.backoff_max_ms, 30000);
  EXPECT_EQ(result->log.level, "debug");
}

TEST(ConfigTest, RejectsNonPositiveEngineValues) {
  auto result = ConfigLoader::load_from_string("[engine]\nmax_attempts = 0\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsUnsupportedDefaults) {
  auto result =
      ConfigLoader::load_from_string("[defaults]\naspect_ratio = \"5:1\"\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsUnknownModel) {
  auto result = ConfigLoader::load_from_string("[api]\nmodel = \"gpt\"\n");
  EXPECT_FALSE(result.has_value());
}

TEST(ConfigTest, MissingFileMeansDefaults) {
  TempDir tmp;
  auto result = ConfigLoader::load(tmp.path() / "absent.toml");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->engine.max_attempts, 3);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  TempDir tmp;
  const auto path = tmp.path() / "config.toml";
  {
    std::ofstream out(path);
    out << "[api]\nkey = \"from-file\"\n[engine]\nmax_attempts = 2\n";
  }
  ScopedEnv key("BANANA_API_KEY", "from-env");
  ScopedEnv attempts("BANANA_MAX_ATTEMPTS", "7");

  auto result = ConfigLoader::load(path);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->api.key, "from-env");
  EXPECT_EQ(result->engine.max_attempts, 7);
}

TEST(ConfigTest, MalformedEnvironmentValue) {
  ScopedEnv attempts("BANANA_MAX_CONCURRENCY", "lots");
  AppConfig cfg;
  auto r = apply_env_overrides(cfg);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, DefaultPathHonoursBananaConfig) {
  ScopedEnv env("BANANA_CONFIG", "/etc/banana/custom.toml");
  EXPECT_EQ(ConfigLoader::default_config_path(),
            std::filesystem::path("/etc/banana/custom.toml"));
}

TEST(ConfigTest, SaveAndReload) {
  TempDir tmp;
  const auto path = tmp.path() / "sub" / "config.toml";

  AppConfig cfg;
  cfg.api.key = "k";
  cfg.defaults.size = "4K";
  cfg.engine.backoff_multiplier = 1.5;
  ASSERT_TRUE(save_config(cfg, path).has_value());

  auto loaded = ConfigLoader::load_from_file(path);
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
  EXPECT_EQ(*loaded, cfg);
}

TEST(ConfigKeysTest, GetKnownKeys) {
  AppConfig cfg;
  EXPECT_EQ(config_get(cfg, "defaults.aspect_ratio").value(), "1:1");
  EXPECT_EQ(config_get(cfg, "engine.max_attempts").value(), "3");
  EXPECT_EQ(config_get(cfg, "database.port").value(), "3306");
}

TEST(ConfigKeysTest, UnknownKeyIsNotFound) {
  AppConfig cfg;
  EXPECT_EQ(config_get(cfg, "api.nope").error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(config_set(cfg, "nope", "1").error(),
            make_error_code(Error::NotFound));
}

TEST(ConfigKeysTest, SecretsAreMasked) {
  AppConfig cfg;
  EXPECT_EQ(config_get(cfg, "api.key").value(), "(not set)");
  cfg.api.key = "AIza-secret";
  EXPECT_EQ(config_get(cfg, "api.key").value(), "****");
  EXPECT_EQ(config_get(cfg, "api.key", true).value(), "AIza-secret");
  EXPECT_TRUE(is_secret_key("database.password"));
  EXPECT_FALSE(is_secret_key("api.model"));
}

TEST(ConfigKeysTest, SetValidatesValue) {
  AppConfig cfg;
  ASSERT_TRUE(config_set(cfg, "defaults.aspect_ratio", "9:16").has_value());
  EXPECT_EQ(cfg.defaults.aspect_ratio, "9:16");

  ASSERT_TRUE(config_set(cfg, "engine.max_concurrency", "6").has_value());
  EXPECT_EQ(cfg.engine.max_concurrency, 6);

  EXPECT_EQ(config_set(cfg, "engine.max_concurrency", "six").error(),
            make_error_code(Error::InvalidArgument));
  EXPECT_EQ(config_set(cfg, "defaults.size", "3K").error(),
            make_error_code(Error::InvalidArgument));
  EXPECT_EQ(config_set(cfg, "engine.max_attempts", "0").error(),
            make_error_code(Error::InvalidArgument));

  // Failed sets leave the config untouched.
  EXPECT_EQ(cfg.defaults.size, "1K");
  EXPECT_EQ(cfg.engine.max_concurrency, 6);
  EXPECT_EQ(cfg.engine.max_attempts, 3);
}

TEST(ConfigKeysTest, EveryKeyRoundTripsThroughGetAndSet) {
  AppConfig cfg;
  for (auto key : config_keys()) {
    auto value = config_get(cfg, key, true);
    ASSERT_TRUE(value.has_value()) << key;
    if (value->empty()) {
      continue;
    }
    EXPECT_TRUE(config_set(cfg, key, *value).has_value()) << key;
  }
  EXPECT_EQ(cfg, AppConfig{});
}
