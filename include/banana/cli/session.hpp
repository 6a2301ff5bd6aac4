#pragma once

#include "banana/cli/commands.hpp"
#include "banana/config/app_config.hpp"
#include "banana/core/error.hpp"
#include "banana/core/runtime.hpp"
#include "banana/engine/job_engine.hpp"
#include "banana/generation/generation_client.hpp"
#include "banana/query/job_query.hpp"
#include "banana/storage/mysql_job_store.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

namespace banana::cli {

/// Effective configuration for a command: file, environment, then
/// --log-level. Prints the failure to stderr.
[[nodiscard]] auto load_config_or_print(const CommonOptions &opts)
    -> Result<AppConfig>;

[[nodiscard]] auto resolve_config_path(const CommonOptions &opts)
    -> std::filesystem::path;

/// Resolves a full id or a unique id prefix, with or without "bn_".
/// NotFound / InvalidArgument (ambiguous) are reported on stderr.
[[nodiscard]] auto resolve_job_id(JobQuery &query, std::string_view input)
    -> Result<JobId>;

/// Everything a command needs to reach the job history: runtime, store and
/// query façade, plus the engine when the command runs jobs.
class Session {
public:
  enum class Mode : std::uint8_t {
    QueryOnly,
    Control, // engine without remote access (cancel)
    Worker,  // engine with a Gemini client; needs an API key
  };

  [[nodiscard]] static auto open(AppConfig config, Mode mode)
      -> Result<std::unique_ptr<Session>>;

  /// Not started; use open().
  explicit Session(AppConfig config);
  ~Session();

  Session(const Session &) = delete;
  auto operator=(const Session &) -> Session & = delete;

  [[nodiscard]] auto config() const noexcept -> const AppConfig & {
    return config_;
  }
  [[nodiscard]] auto runtime() noexcept -> Runtime & { return runtime_; }
  [[nodiscard]] auto store() noexcept -> JobStore & { return *store_; }
  [[nodiscard]] auto query() noexcept -> JobQuery & { return *query_; }
  /// Null in QueryOnly mode.
  [[nodiscard]] auto engine() noexcept -> JobEngine * { return engine_.get(); }
  /// Jobs a Worker session scheduled from history when it opened.
  [[nodiscard]] auto recovered() const noexcept -> std::size_t {
    return recovered_;
  }

  template <typename T> [[nodiscard]] auto block_on(task<T> op) -> T {
    return runtime_.block_on(std::move(op));
  }

  [[nodiscard]] auto resolve_job_id(std::string_view input) -> Result<JobId>;

private:
  AppConfig config_;
  std::unique_ptr<storage::MySQLJobStore> store_;
  std::unique_ptr<GenerationClient> client_;
  std::unique_ptr<JobEngine> engine_;
  std::unique_ptr<JobQuery> query_;
  std::size_t recovered_{0};
  // Declared last: destroyed first, so coroutine frames still parked in the
  // io_context are torn down while the engine and store exist.
  Runtime runtime_;
};

} // namespace banana::cli
