#pragma once

#include "banana/core/asio_awaitable.hpp"
#include "banana/core/coroutine.hpp"
#include "banana/core/error.hpp"
#include "banana/generation/generation_client.hpp"
#include "banana/job/job.hpp"
#include "banana/storage/job_store.hpp"
#include "banana/util/id.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <filesystem>
#include <format>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace banana::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

inline auto
run_coro(task<void> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> void {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  bool done = false;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        co_await std::move(coro);
        done = true;
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!done && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            std::format("banana_test_{:08x}{:08x}", rd(), rd());
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  auto operator=(const TempDir &) -> TempDir & = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path & {
    return path_;
  }

private:
  std::filesystem::path path_;
};

[[nodiscard]] inline auto make_queued_job(std::string_view id,
                                          util::TimePoint created_at)
    -> Job {
  Job job;
  job.id = JobId{id};
  job.prompt = std::format("prompt for {}", id);
  job.created_at = created_at;
  job.updated_at = created_at;
  return job;
}

// In-memory JobStore with the same compare-and-swap rules as the MySQL
// store. Thread safe; every call completes without suspending.
class FakeJobStore final : public JobStore {
public:
  auto open() -> task<Result<void>> override {
    open_ = true;
    co_return ok();
  }
  auto close() -> task<void> override {
    open_ = false;
    co_return;
  }
  [[nodiscard]] auto is_open() const noexcept -> bool override {
    return open_;
  }

  auto create(const Job &job) -> task<Result<Job>> override {
    std::lock_guard lock(mu_);
    if (forced_duplicates_ > 0) {
      --forced_duplicates_;
      co_return fail(Error::DuplicateId);
    }
    if (job.status != JobStatus::Queued || !check_invariants(job)) {
      co_return fail(Error::InvalidState);
    }
    if (!jobs_.emplace(job.id, job).second) {
      co_return fail(Error::DuplicateId);
    }
    co_return job;
  }

  auto transition(const JobId &id, JobStatus expected_status,
                  JobStatus new_status, const JobTransition &fields)
      -> task<Result<Job>> override {
    std::lock_guard lock(mu_);
    ++transition_calls_;
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      co_return fail(Error::NotFound);
    }
    auto &current = it->second;
    if (current.status != expected_status ||
        (fields.expected_attempt_count &&
         current.attempt_count != *fields.expected_attempt_count)) {
      co_return fail(Error::StaleTransition);
    }
    auto next = apply_transition(current, new_status, fields);
    if (!next) {
      co_return fail(next.error());
    }
    current = *next;
    co_return current;
  }

  auto get(const JobId &id) -> task<Result<Job>> override {
    std::lock_guard lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      co_return fail(Error::NotFound);
    }
    co_return it->second;
  }

  auto list(const JobFilter &filter) -> task<Result<std::vector<Job>>> override {
    std::lock_guard lock(mu_);
    co_return select(filter);
  }

  auto count(const JobFilter &filter) -> task<Result<std::size_t>> override {
    std::lock_guard lock(mu_);
    ++count_calls_;
    auto unlimited = filter;
    unlimited.limit = 0;
    co_return select(unlimited).size();
  }

  auto count_by_status() -> task<Result<StatusCounts>> override {
    std::lock_guard lock(mu_);
    ++count_by_status_calls_;
    StatusCounts counts;
    for (const auto &[id, job] : jobs_) {
      counts.add(job.status, 1);
    }
    co_return counts;
  }

  auto purge(const JobId &id) -> task<Result<void>> override {
    std::lock_guard lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      co_return fail(Error::NotFound);
    }
    if (!is_terminal(it->second.status)) {
      co_return fail(Error::InvalidState);
    }
    jobs_.erase(it);
    co_return ok();
  }

  auto purge_terminal() -> task<Result<std::size_t>> override {
    std::lock_guard lock(mu_);
    std::size_t removed = std::erase_if(
        jobs_, [](const auto &kv) { return is_terminal(kv.second.status); });
    co_return removed;
  }

  /// Stores `job` as-is, bypassing create() checks.
  auto put(Job job) -> void {
    std::lock_guard lock(mu_);
    jobs_.insert_or_assign(job.id, std::move(job));
  }

  [[nodiscard]] auto snapshot(const JobId &id) const -> std::optional<Job> {
    std::lock_guard lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mu_);
    return jobs_.size();
  }

  /// The next `n` create() calls fail with DuplicateId.
  auto force_duplicates(int n) -> void {
    std::lock_guard lock(mu_);
    forced_duplicates_ = n;
  }

  [[nodiscard]] auto transition_calls() const -> int {
    std::lock_guard lock(mu_);
    return transition_calls_;
  }

  [[nodiscard]] auto count_calls() const -> int {
    std::lock_guard lock(mu_);
    return count_calls_;
  }

  [[nodiscard]] auto count_by_status_calls() const -> int {
    std::lock_guard lock(mu_);
    return count_by_status_calls_;
  }

private:
  [[nodiscard]] auto select(const JobFilter &filter) const
      -> std::vector<Job> {
    std::vector<Job> out;
    for (const auto &[id, job] : jobs_) {
      if (filter.matches(job)) {
        out.push_back(job);
      }
    }
    std::ranges::sort(out, [](const Job &a, const Job &b) {
      if (a.created_at != b.created_at) {
        return a.created_at > b.created_at;
      }
      return a.id > b.id;
    });
    if (filter.limit > 0 && out.size() > filter.limit) {
      out.resize(filter.limit);
    }
    return out;
  }

  mutable std::mutex mu_;
  std::map<JobId, Job> jobs_;
  bool open_{false};
  int forced_duplicates_{0};
  int transition_calls_{0};
  int count_calls_{0};
  int count_by_status_calls_{0};
};

[[nodiscard]] inline auto transient(std::string detail = "HTTP 503: busy")
    -> GenerationOutcome {
  return std::unexpected(GenerationFailure{.error_class = ErrorClass::Transient,
                                           .detail = std::move(detail),
                                           .http_status = 503});
}

[[nodiscard]] inline auto permanent(std::string detail = "HTTP 400: bad")
    -> GenerationOutcome {
  return std::unexpected(GenerationFailure{.error_class = ErrorClass::Permanent,
                                           .detail = std::move(detail),
                                           .http_status = 400});
}

[[nodiscard]] inline auto unknown(std::string detail = "No images generated")
    -> GenerationOutcome {
  return std::unexpected(GenerationFailure{.error_class = ErrorClass::Unknown,
                                           .detail = std::move(detail),
                                           .http_status = 200});
}

// Replays scripted outcomes in order; once the script runs out every call
// succeeds with one artifact. An optional per-call delay simulates a slow
// remote call and honours cancellation.
class FakeGenerationClient final : public GenerationClient {
public:
  auto script(std::vector<GenerationOutcome> outcomes) -> void {
    std::lock_guard lock(mu_);
    script_.assign(std::make_move_iterator(outcomes.begin()),
                   std::make_move_iterator(outcomes.end()));
  }

  auto set_delay(std::chrono::milliseconds delay) -> void {
    std::lock_guard lock(mu_);
    delay_ = delay;
  }

  auto generate(const GenerationRequest &request)
      -> task<GenerationOutcome> override {
    std::chrono::milliseconds delay{0};
    std::optional<GenerationOutcome> scripted;
    {
      std::lock_guard lock(mu_);
      requests_.push_back(request);
      delay = delay_;
      if (!script_.empty()) {
        scripted = std::move(script_.front());
        script_.pop_front();
      }
    }
    calls_.fetch_add(1, std::memory_order_acq_rel);
    const int now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
    int seen = max_in_flight_.load(std::memory_order_acquire);
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }

    if (delay.count() > 0) {
      boost::asio::steady_timer timer(
          co_await boost::asio::this_coro::executor);
      timer.expires_after(delay);
      auto [ec] = co_await timer.async_wait(use_nothrow);
      (void)ec;
    }
    in_flight_.fetch_sub(1, std::memory_order_acq_rel);

    if (scripted) {
      co_return std::move(*scripted);
    }
    co_return std::vector<std::string>{
        std::format("/tmp/banana-test/{}.png", request.job_id)};
  }

  [[nodiscard]] auto calls() const -> int {
    return calls_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto max_in_flight() const -> int {
    return max_in_flight_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto requests() const -> std::vector<GenerationRequest> {
    std::lock_guard lock(mu_);
    return requests_;
  }

private:
  mutable std::mutex mu_;
  std::deque<GenerationOutcome> script_;
  std::vector<GenerationRequest> requests_;
  std::chrono::milliseconds delay_{0};
  std::atomic<int> calls_{0};
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
};

} // namespace banana::test
