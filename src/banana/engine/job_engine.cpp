#include "banana/engine/job_engine.hpp"

#include "banana/core/asio_awaitable.hpp"
#include "banana/core/runtime.hpp"
#include "banana/util/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <format>
#include <ranges>
#include <vector>

namespace banana {

namespace {

constexpr int kMaxIdGenerationAttempts = 8;
constexpr int kMaxCancelAttempts = 4;
constexpr std::string_view kCancelledDetail = "Cancelled by user";

[[nodiscard]] auto is_stale(const std::error_code &ec) -> bool {
  return ec == make_error_code(Error::StaleTransition);
}

[[nodiscard]] auto is_blank(std::string_view text) -> bool {
  return std::ranges::all_of(text, [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  });
}

[[nodiscard]] auto validate_request(const SubmitRequest &req)
    -> Result<void> {
  if (is_blank(req.prompt)) {
    log::warn("Rejecting job: empty prompt");
    return fail(Error::InvalidArgument);
  }
  if (req.kind == JobKind::Edit &&
      (!req.input_reference || req.input_reference->empty())) {
    log::warn("Rejecting edit job without an input image");
    return fail(Error::InvalidArgument);
  }
  if (req.parent_id && !is_valid_job_id(req.parent_id->value())) {
    log::warn("Rejecting job: malformed parent id '{}'", *req.parent_id);
    return fail(Error::InvalidArgument);
  }
  return validate_params(req.params);
}

} // namespace

auto engine_options_from(const EngineConfig &cfg) -> EngineOptions {
  EngineOptions out;
  out.max_concurrency = cfg.max_concurrency;
  out.max_attempts = cfg.max_attempts;
  out.backoff.initial = std::chrono::milliseconds{cfg.backoff_initial_ms};
  out.backoff.max = std::chrono::milliseconds{cfg.backoff_max_ms};
  out.backoff.multiplier = cfg.backoff_multiplier;
  out.attempt_timeout = std::chrono::seconds{cfg.attempt_timeout_sec};
  out.recover_stale_after = std::chrono::seconds{cfg.recover_stale_after_sec};
  return out;
}

JobEngine::JobEngine(Runtime &runtime, JobStore &store,
                     GenerationClient &client, EngineOptions options)
    : runtime_(runtime), store_(store), client_(client),
      options_(std::move(options)), backoff_(options_.backoff) {
  options_.max_concurrency = std::max(1, options_.max_concurrency);
  options_.max_attempts = std::max(1, options_.max_attempts);
}

JobEngine::~JobEngine() { shutdown(); }

auto JobEngine::submit(SubmitRequest request) -> task<Result<JobId>> {
  if (auto v = validate_request(request); !v) {
    co_return fail(v.error());
  }

  for (int i = 0; i < kMaxIdGenerationAttempts; ++i) {
    const auto now = util::Clock::now();
    Job job;
    job.id = generate_job_id();
    job.kind = request.kind;
    job.prompt = request.prompt;
    job.input_reference = request.input_reference;
    job.parent_id = request.parent_id;
    job.params = request.params;
    job.status = JobStatus::Queued;
    job.created_at = now;
    job.updated_at = now;

    auto created = co_await store_.create(job);
    if (created) {
      log::info("[{}] Queued {} job", created->id, to_string_view(job.kind));
      notify(*created);
      schedule(created->id.clone());
      co_return created->id.clone();
    }
    if (created.error() != make_error_code(Error::DuplicateId)) {
      co_return fail(created.error());
    }
    log::debug("Job id {} already taken, generating another", job.id);
  }
  co_return fail(Error::DuplicateId);
}

auto JobEngine::drive(JobId id) -> task<Result<Job>> {
  if (!try_activate(id)) {
    co_return fail(Error::InvalidState);
  }
  struct ActiveGuard {
    JobEngine &engine;
    const JobId &id;
    ~ActiveGuard() { engine.deactivate(id); }
  } guard{*this, id};

  auto strand = boost::asio::make_strand(runtime_.executor());
  co_return co_await co_spawn(strand, run_loop(id.clone()), use_awaitable);
}

auto JobEngine::schedule(JobId id) -> void {
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return;
    }
    if (active_.contains(id) || std::ranges::find(pending_, id) !=
                                    pending_.end()) {
      log::debug("[{}] Already scheduled", id);
      return;
    }
    pending_.push_back(std::move(id));
  }
  pump();
}

auto JobEngine::pump() -> void {
  std::vector<JobId> to_start;
  {
    std::lock_guard lock(mu_);
    while (!stopping_ && running_slots_ < options_.max_concurrency &&
           !pending_.empty()) {
      to_start.push_back(std::move(pending_.front()));
      pending_.pop_front();
      ++running_slots_;
    }
  }
  for (auto &id : to_start) {
    co_spawn(runtime_.executor(), run_scheduled(std::move(id)), detached);
  }
}

auto JobEngine::run_scheduled(JobId id) -> spawn_task {
  struct SlotGuard {
    JobEngine &engine;
    ~SlotGuard() {
      {
        std::lock_guard lock(engine.mu_);
        --engine.running_slots_;
      }
      engine.pump();
    }
  } guard{*this};

  auto result = co_await drive(id.clone());
  if (!result) {
    if (result.error() == make_error_code(Error::InvalidState)) {
      log::debug("[{}] Already being driven", id);
    } else {
      log::error("[{}] Drive failed: {}", id, result.error().message());
    }
  }
}

auto JobEngine::run_loop(JobId id) -> task<Result<Job>> {
  auto loaded = co_await store_.get(id);
  if (!loaded) {
    co_return fail(loaded.error());
  }
  Job job = std::move(*loaded);

  // True once this loop owns the attempt recorded in job.attempt_count.
  bool armed = false;
  for (;;) {
    if (is_terminal(job.status)) {
      co_return job;
    }

    if (job.status == JobStatus::Queued) {
      auto claimed = co_await claim(job);
      if (!claimed) {
        if (is_stale(claimed.error())) {
          co_return co_await reread_after_stale(id, "claim");
        }
        co_return fail(claimed.error());
      }
      job = std::move(*claimed);
      armed = true;
    } else if (!armed) {
      // Resumed Running job; the attempt it recorded was interrupted.
      if (job.attempt_count >= options_.max_attempts) {
        auto failed = co_await fail_job(
            job, FailureKind::TransientExhausted,
            std::format("Interrupted after {} attempts", job.attempt_count));
        if (!failed && is_stale(failed.error())) {
          co_return co_await reread_after_stale(id, "fail");
        }
        co_return failed;
      }
      auto advanced = co_await advance(job);
      if (!advanced) {
        if (is_stale(advanced.error())) {
          co_return co_await reread_after_stale(id, "resume");
        }
        co_return fail(advanced.error());
      }
      job = std::move(*advanced);
      armed = true;
    }

    log::info("[{}] Attempt {}/{}", id, job.attempt_count,
              options_.max_attempts);
    auto outcome = co_await attempt(job);

    if (outcome) {
      auto done = co_await complete(job, std::move(*outcome));
      if (!done && is_stale(done.error())) {
        log::warn("[{}] Discarding result of attempt {}: job changed while "
                  "the request was in flight",
                  id, job.attempt_count);
        co_return co_await reread_after_stale(id, "complete");
      }
      if (done) {
        log::info("[{}] Completed with {} artifact(s)", id,
                  done->output_references.size());
      }
      co_return done;
    }

    const auto &failure = outcome.error();
    if (!failure.is_retryable()) {
      log::warn("[{}] Attempt {} failed permanently: {}", id,
                job.attempt_count, failure.detail);
      auto failed = co_await fail_job(job, FailureKind::Permanent,
                                      failure.detail);
      if (!failed && is_stale(failed.error())) {
        co_return co_await reread_after_stale(id, "fail");
      }
      co_return failed;
    }

    if (job.attempt_count >= options_.max_attempts) {
      log::warn("[{}] Giving up after {} attempts: {}", id, job.attempt_count,
                failure.detail);
      auto failed = co_await fail_job(
          job, FailureKind::TransientExhausted,
          std::format("{} (after {} attempts)", failure.detail,
                      job.attempt_count));
      if (!failed && is_stale(failed.error())) {
        co_return co_await reread_after_stale(id, "fail");
      }
      co_return failed;
    }

    log::warn("[{}] Attempt {} failed, will retry: {}", id, job.attempt_count,
              failure.detail);
    if (is_stopping()) {
      log::info("[{}] Engine stopping; leaving job for recovery", id);
      co_return job;
    }
    co_await backoff_sleep(job);
    if (is_stopping()) {
      log::info("[{}] Engine stopping; leaving job for recovery", id);
      co_return job;
    }

    auto advanced = co_await advance(job);
    if (!advanced) {
      if (is_stale(advanced.error())) {
        co_return co_await reread_after_stale(id, "retry");
      }
      co_return fail(advanced.error());
    }
    job = std::move(*advanced);
  }
}

auto JobEngine::claim(const Job &job) -> task<Result<Job>> {
  JobTransition fields;
  fields.expected_attempt_count = 0;
  fields.attempt_count = 1;
  co_return co_await commit(job, JobStatus::Running, std::move(fields));
}

auto JobEngine::advance(const Job &job) -> task<Result<Job>> {
  JobTransition fields;
  fields.expected_attempt_count = job.attempt_count;
  fields.attempt_count = job.attempt_count + 1;
  co_return co_await commit(job, JobStatus::Running, std::move(fields));
}

auto JobEngine::complete(const Job &job, std::vector<std::string> outputs)
    -> task<Result<Job>> {
  JobTransition fields;
  fields.expected_attempt_count = job.attempt_count;
  fields.attempt_count = job.attempt_count;
  fields.output_references = std::move(outputs);
  co_return co_await commit(job, JobStatus::Completed, std::move(fields));
}

auto JobEngine::fail_job(const Job &job, FailureKind kind, std::string detail)
    -> task<Result<Job>> {
  JobTransition fields;
  fields.expected_attempt_count = job.attempt_count;
  fields.attempt_count = job.attempt_count;
  fields.error = ErrorSummary{.kind = kind, .detail = std::move(detail)};
  co_return co_await commit(job, JobStatus::Failed, std::move(fields));
}

auto JobEngine::commit(const Job &job, JobStatus new_status,
                       JobTransition fields) -> task<Result<Job>> {
  fields.updated_at = util::Clock::now();
  auto result =
      co_await store_.transition(job.id, job.status, new_status, fields);
  if (result) {
    notify(*result);
  }
  co_return result;
}

auto JobEngine::attempt(const Job &job) -> task<GenerationOutcome> {
  GenerationRequest request{.job_id = job.id.clone(),
                            .kind = job.kind,
                            .prompt = job.prompt,
                            .params = job.params,
                            .input_reference = job.input_reference};

  boost::asio::steady_timer deadline(co_await boost::asio::this_coro::executor);
  deadline.expires_after(options_.attempt_timeout);

  using namespace awaitable_ops;
  auto result =
      co_await (client_.generate(request) || deadline.async_wait(use_nothrow));
  if (result.index() == 1) {
    co_return std::unexpected(GenerationFailure{
        .error_class = ErrorClass::Transient,
        .detail = std::format(
            "Attempt timed out after {}s",
            std::chrono::duration_cast<std::chrono::seconds>(
                options_.attempt_timeout)
                .count()),
        .http_status = 0});
  }
  co_return std::move(std::get<0>(result));
}

auto JobEngine::backoff_sleep(const Job &job) -> task<void> {
  const auto delay = backoff_.delay(job.attempt_count);
  auto timer = std::make_shared<boost::asio::steady_timer>(
      co_await boost::asio::this_coro::executor);
  timer->expires_after(delay);
  {
    std::lock_guard lock(mu_);
    // shutdown() and cancel() only interrupt timers already registered.
    if (stopping_ || cancelled_.contains(job.id)) {
      log::debug("[{}] Skipping backoff", job.id);
      co_return;
    }
    backoff_timers_[job.id] = timer;
  }

  log::info("[{}] Retrying in {}ms", job.id, delay.count());
  auto [ec] = co_await timer->async_wait(use_nothrow);

  {
    std::lock_guard lock(mu_);
    if (auto it = backoff_timers_.find(job.id);
        it != backoff_timers_.end() && it->second == timer) {
      backoff_timers_.erase(it);
    }
  }
  if (ec) {
    log::debug("[{}] Backoff interrupted", job.id);
  }
}

auto JobEngine::reread_after_stale(const JobId &id, std::string_view what)
    -> task<Result<Job>> {
  auto current = co_await store_.get(id);
  if (current) {
    log::info("[{}] Lost {} race; job is now {} (attempt {})", id, what,
              to_string_view(current->status), current->attempt_count);
  }
  co_return current;
}

auto JobEngine::cancel(JobId id) -> task<Result<Job>> {
  for (int i = 0; i < kMaxCancelAttempts; ++i) {
    auto current = co_await store_.get(id);
    if (!current) {
      co_return fail(current.error());
    }
    if (is_terminal(current->status)) {
      co_return fail(Error::InvalidState);
    }

    JobTransition fields;
    fields.attempt_count = current->attempt_count;
    fields.error = ErrorSummary{.kind = FailureKind::Cancelled,
                                .detail = std::string(kCancelledDetail)};
    auto result = co_await store_.transition(id, current->status,
                                             JobStatus::Failed, fields);
    if (result) {
      log::info("[{}] Cancelled", id);
      notify(*result);

      std::shared_ptr<boost::asio::steady_timer> timer;
      {
        std::lock_guard lock(mu_);
        if (active_.contains(id)) {
          cancelled_.insert(id.clone());
        }
        if (auto it = backoff_timers_.find(id); it != backoff_timers_.end()) {
          timer = it->second;
        }
      }
      if (timer) {
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
      }
      co_return result;
    }
    if (!is_stale(result.error())) {
      co_return fail(result.error());
    }
    // A driver moved the job between our read and write; look again.
  }
  co_return fail(Error::StaleTransition);
}

auto JobEngine::recover() -> task<Result<std::size_t>> {
  auto running = co_await store_.list(JobFilter{.status = JobStatus::Running});
  if (!running) {
    co_return fail(running.error());
  }
  auto queued = co_await store_.list(JobFilter{.status = JobStatus::Queued});
  if (!queued) {
    co_return fail(queued.error());
  }

  const auto now = util::Clock::now();
  std::size_t scheduled = 0;
  // Lists are newest first; resume oldest first.
  for (auto &job : *running | std::views::reverse) {
    if (now - job.updated_at < options_.recover_stale_after) {
      log::debug("[{}] Running and recently updated; assuming it is owned "
                 "by a live process",
                 job.id);
      continue;
    }
    log::info("[{}] Recovering running job at attempt {}", job.id,
              job.attempt_count);
    schedule(job.id.clone());
    ++scheduled;
  }
  for (auto &job : *queued | std::views::reverse) {
    schedule(job.id.clone());
    ++scheduled;
  }
  co_return scheduled;
}

auto JobEngine::wait(JobId id, std::chrono::milliseconds timeout)
    -> task<Result<Job>> {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto job = co_await store_.get(id);
    if (!job) {
      co_return fail(job.error());
    }
    if (is_terminal(job->status)) {
      co_return job;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      co_return fail(Error::Timeout);
    }
    co_await async_sleep(options_.poll_interval);
  }
}

auto JobEngine::wait_idle() -> task<void> {
  while (!is_idle()) {
    co_await async_sleep(options_.poll_interval);
  }
}

auto JobEngine::shutdown() -> void {
  std::vector<std::shared_ptr<boost::asio::steady_timer>> timers;
  {
    std::lock_guard lock(mu_);
    stopping_ = true;
    pending_.clear();
    for (auto &[id, timer] : backoff_timers_) {
      timers.push_back(timer);
    }
    backoff_timers_.clear();
  }
  for (auto &timer : timers) {
    boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
  }
}

auto JobEngine::subscribe(JobListener listener) -> SubscriptionId {
  std::lock_guard lock(listeners_mu_);
  const auto id = next_subscription_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

auto JobEngine::unsubscribe(SubscriptionId id) -> void {
  std::lock_guard lock(listeners_mu_);
  listeners_.erase(id);
}

auto JobEngine::notify(const Job &job) -> void {
  change_seq_.fetch_add(1, std::memory_order_acq_rel);

  std::vector<JobListener> snapshot;
  {
    std::lock_guard lock(listeners_mu_);
    snapshot.reserve(listeners_.size());
    for (const auto &[id, listener] : listeners_) {
      snapshot.push_back(listener);
    }
  }

  const JobEvent event{.job_id = job.id.clone(),
                       .status = job.status,
                       .attempt_count = job.attempt_count};
  for (auto &listener : snapshot) {
    try {
      listener(event);
    } catch (const std::exception &e) {
      log::error("[{}] Job listener threw: {}", job.id, e.what());
    }
  }
}

auto JobEngine::try_activate(const JobId &id) -> bool {
  std::lock_guard lock(mu_);
  return active_.insert(id.clone()).second;
}

auto JobEngine::deactivate(const JobId &id) -> void {
  std::lock_guard lock(mu_);
  active_.erase(id);
  cancelled_.erase(id);
}

auto JobEngine::active_count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return active_.size();
}

auto JobEngine::is_stopping() const -> bool {
  std::lock_guard lock(mu_);
  return stopping_;
}

auto JobEngine::is_idle() const -> bool {
  std::lock_guard lock(mu_);
  return active_.empty() && pending_.empty() && running_slots_ == 0;
}

} // namespace banana
