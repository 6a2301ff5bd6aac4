#include "banana/cli/session.hpp"

#include "banana/config/config.hpp"
#include "banana/generation/gemini_client.hpp"
#include "banana/util/log.hpp"

#include <print>

namespace banana::cli {

namespace {

constexpr auto kDrainTimeout = std::chrono::seconds{5};
constexpr std::size_t kRuntimeThreads = 4;

// Stand-in for sessions that only cancel jobs and never call the service.
class OfflineGenerationClient final : public GenerationClient {
public:
  auto generate(const GenerationRequest & /*request*/)
      -> task<GenerationOutcome> override {
    co_return std::unexpected(
        GenerationFailure{.error_class = ErrorClass::Permanent,
                          .detail = "No generation client in this session",
                          .http_status = 0});
  }
};

auto drain(JobEngine &engine, std::chrono::milliseconds timeout)
    -> task<bool> {
  using namespace awaitable_ops;
  auto done = co_await (engine.wait_idle() || async_sleep(timeout));
  co_return done.index() == 0;
}

auto configure_logging(const LogConfig &cfg) -> void {
  log::set_output_stderr();
  log::set_level(cfg.level);
  if (!cfg.file.empty() && !log::set_output_file(cfg.file)) {
    std::println(stderr, "Warning: cannot open log file '{}', logging to "
                         "stderr",
                 cfg.file);
  }
  log::start();
}

} // namespace

auto resolve_config_path(const CommonOptions &opts) -> std::filesystem::path {
  if (!opts.config_file.empty()) {
    return opts.config_file;
  }
  return ConfigLoader::default_config_path();
}

auto load_config_or_print(const CommonOptions &opts) -> Result<AppConfig> {
  const auto path = resolve_config_path(opts);
  auto cfg = ConfigLoader::load(path);
  if (!cfg) {
    std::println(stderr, "Error: failed to load config '{}': {}",
                 path.string(), cfg.error().message());
    return fail(cfg.error());
  }
  if (opts.log_level) {
    cfg->log.level = *opts.log_level;
  }
  configure_logging(cfg->log);
  return cfg;
}

Session::Session(AppConfig config)
    : config_(std::move(config)), runtime_(kRuntimeThreads) {}

auto Session::open(AppConfig config, Mode mode)
    -> Result<std::unique_ptr<Session>> {
  auto session = std::make_unique<Session>(std::move(config));
  if (auto r = session->runtime_.start(); !r) {
    return fail(r.error());
  }

  session->store_ = std::make_unique<storage::MySQLJobStore>(
      session->runtime_.executor(), session->config_.database);
  if (auto r = session->block_on(session->store_->open()); !r) {
    log::error("Cannot open job history at {}:{}/{}: {}",
               session->config_.database.host, session->config_.database.port,
               session->config_.database.database, r.error().message());
    return fail(r.error());
  }
  session->query_ =
      std::make_unique<JobQuery>(session->runtime_, *session->store_);

  if (mode == Mode::QueryOnly) {
    return ok(std::move(session));
  }

  if (mode == Mode::Worker) {
    const auto &api = session->config_.api;
    auto client = GeminiClient::create(
        session->runtime_.executor(),
        GeminiClientConfig{.api_key = api.key,
                           .base_url = api.base_url,
                           .timeout = std::chrono::seconds{api.timeout_sec}});
    if (!client) {
      return fail(client.error());
    }
    session->client_ = std::move(*client);
  } else {
    session->client_ = std::make_unique<OfflineGenerationClient>();
  }

  session->engine_ = std::make_unique<JobEngine>(
      session->runtime_, *session->store_, *session->client_,
      engine_options_from(session->config_.engine));
  if (mode == Mode::Control) {
    session->engine_->shutdown();
    return ok(std::move(session));
  }

  // A worker picks up what earlier processes left behind before taking
  // new work.
  auto recovered = session->block_on(session->engine_->recover());
  if (!recovered) {
    log::error("Cannot scan job history for recovery: {}",
               recovered.error().message());
    return fail(recovered.error());
  }
  session->recovered_ = *recovered;
  if (*recovered > 0) {
    log::info("Resuming {} job(s) left by an earlier run", *recovered);
  }
  return ok(std::move(session));
}

Session::~Session() {
  if (runtime_.is_running()) {
    if (engine_) {
      engine_->shutdown();
      if (!runtime_.block_on(drain(*engine_, kDrainTimeout))) {
        log::warn("{} job(s) still running at exit; `banana jobs resume` "
                  "picks them up later",
                  engine_->active_count());
      }
    }
    if (store_) {
      runtime_.block_on(store_->close());
    }
  }
  runtime_.stop();
  log::stop();
}

auto resolve_job_id(JobQuery &query, std::string_view input)
    -> Result<JobId> {
  auto prefix = expand_job_id_prefix(input);
  if (auto exact = query.get_blocking(JobId{prefix}); exact) {
    return ok(exact->id.clone());
  }

  auto matches = query.list_blocking(
      JobFilter{.id_prefix = std::move(prefix), .limit = 2});
  if (!matches) {
    std::println(stderr, "Error: {}", matches.error().message());
    return fail(matches.error());
  }
  if (matches->empty()) {
    std::println(stderr, "Error: no job matches '{}'", input);
    return fail(Error::NotFound);
  }
  if (matches->size() > 1) {
    std::println(stderr, "Error: job id prefix '{}' is ambiguous", input);
    return fail(Error::InvalidArgument);
  }
  return ok(matches->front().id.clone());
}

auto Session::resolve_job_id(std::string_view input) -> Result<JobId> {
  return cli::resolve_job_id(*query_, input);
}

} // namespace banana::cli
