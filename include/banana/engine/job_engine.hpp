#pragma once

#include "banana/config/app_config.hpp"
#include "banana/core/coroutine.hpp"
#include "banana/core/error.hpp"
#include "banana/generation/generation_client.hpp"
#include "banana/job/job.hpp"
#include "banana/storage/job_store.hpp"
#include "banana/util/backoff.hpp"

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace banana {

class Runtime;

struct EngineOptions {
  int max_concurrency{2};
  int max_attempts{3};
  RetryBackoff::Config backoff{};
  std::chrono::milliseconds attempt_timeout{std::chrono::seconds{120}};
  std::chrono::seconds recover_stale_after{300};
  std::chrono::milliseconds poll_interval{100};
};

[[nodiscard]] auto engine_options_from(const EngineConfig &cfg)
    -> EngineOptions;

struct SubmitRequest {
  JobKind kind{JobKind::Generate};
  std::string prompt;
  std::optional<std::string> input_reference;
  std::optional<JobId> parent_id;
  GenerationParams params;
};

/// Emitted after every committed transition (and on creation).
struct JobEvent {
  JobId job_id;
  JobStatus status{JobStatus::Queued};
  int attempt_count{0};
};

using SubscriptionId = std::uint64_t;
using JobListener = std::function<void(const JobEvent &)>;

// Drives jobs through Queued -> Running -> {Completed, Failed}, retrying
// transient failures with backoff. Every state change is committed to the
// JobStore before the next remote call, so a restarted process can resume
// from the store alone (recover()).
//
// At most max_concurrency jobs run at once; further scheduled jobs wait in
// FIFO order. Each job's loop runs on its own strand.
class JobEngine {
public:
  JobEngine(Runtime &runtime, JobStore &store, GenerationClient &client,
            EngineOptions options = {});
  ~JobEngine();

  JobEngine(const JobEngine &) = delete;
  auto operator=(const JobEngine &) -> JobEngine & = delete;

  /// Validates, persists as Queued and schedules. InvalidArgument for a
  /// malformed request.
  auto submit(SubmitRequest request) -> task<Result<JobId>>;

  /// Runs the job's loop to a terminal state in the calling coroutine and
  /// returns the final record. Terminal jobs are returned untouched.
  /// InvalidState if this process is already driving the job.
  auto drive(JobId id) -> task<Result<Job>>;

  /// Queues the job for a bounded background drive. Duplicate requests for
  /// a job already pending or active are dropped.
  auto schedule(JobId id) -> void;

  /// Queued or Running -> Failed(cancelled). Interrupts a backoff sleep;
  /// an in-flight remote call finishes and its result is discarded.
  auto cancel(JobId id) -> task<Result<Job>>;

  /// Schedules every queued job and every running job not updated within
  /// recover_stale_after. Returns how many were scheduled.
  auto recover() -> task<Result<std::size_t>>;

  /// Timeout if the job is not terminal within `timeout`.
  auto wait(JobId id, std::chrono::milliseconds timeout) -> task<Result<Job>>;

  /// Completes once nothing is active or pending.
  auto wait_idle() -> task<void>;

  /// Stops starting queued drives and interrupts backoff sleeps.
  auto shutdown() -> void;

  auto subscribe(JobListener listener) -> SubscriptionId;
  auto unsubscribe(SubscriptionId id) -> void;

  /// Incremented after every committed transition.
  [[nodiscard]] auto change_sequence() const noexcept -> std::uint64_t {
    return change_seq_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto active_count() const -> std::size_t;
  [[nodiscard]] auto is_idle() const -> bool;

  [[nodiscard]] auto options() const noexcept -> const EngineOptions & {
    return options_;
  }

private:
  auto run_loop(JobId id) -> task<Result<Job>>;
  auto run_scheduled(JobId id) -> spawn_task;
  auto pump() -> void;

  auto claim(const Job &job) -> task<Result<Job>>;
  auto advance(const Job &job) -> task<Result<Job>>;
  auto complete(const Job &job, std::vector<std::string> outputs)
      -> task<Result<Job>>;
  auto fail_job(const Job &job, FailureKind kind, std::string detail)
      -> task<Result<Job>>;
  auto commit(const Job &job, JobStatus new_status, JobTransition fields)
      -> task<Result<Job>>;

  auto attempt(const Job &job) -> task<GenerationOutcome>;
  auto backoff_sleep(const Job &job) -> task<void>;

  /// Latest stored record after a lost compare-and-swap.
  auto reread_after_stale(const JobId &id, std::string_view what)
      -> task<Result<Job>>;

  auto notify(const Job &job) -> void;

  [[nodiscard]] auto is_stopping() const -> bool;
  auto try_activate(const JobId &id) -> bool;
  auto deactivate(const JobId &id) -> void;

  Runtime &runtime_;
  JobStore &store_;
  GenerationClient &client_;
  EngineOptions options_;
  RetryBackoff backoff_;

  mutable std::mutex mu_;
  std::unordered_set<JobId> active_;
  std::deque<JobId> pending_;
  int running_slots_{0};
  bool stopping_{false};
  std::unordered_map<JobId, std::shared_ptr<boost::asio::steady_timer>>
      backoff_timers_;
  // Active jobs cancelled by this process; their drivers skip the backoff.
  std::unordered_set<JobId> cancelled_;

  std::mutex listeners_mu_;
  std::map<SubscriptionId, JobListener> listeners_;
  SubscriptionId next_subscription_{1};
  std::atomic<std::uint64_t> change_seq_{0};
};

} // namespace banana
