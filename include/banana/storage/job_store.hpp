#pragma once

#include "banana/core/coroutine.hpp"
#include "banana/core/error.hpp"
#include "banana/job/job.hpp"

#include <cstddef>
#include <vector>

namespace banana {

struct StatusCounts {
  std::size_t queued{0};
  std::size_t running{0};
  std::size_t completed{0};
  std::size_t failed{0};

  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return queued + running + completed + failed;
  }

  [[nodiscard]] auto of(JobStatus s) const noexcept -> std::size_t {
    switch (s) {
    case JobStatus::Queued:
      return queued;
    case JobStatus::Running:
      return running;
    case JobStatus::Completed:
      return completed;
    case JobStatus::Failed:
      return failed;
    }
    return 0;
  }

  auto add(JobStatus s, std::size_t n) noexcept -> void {
    switch (s) {
    case JobStatus::Queued:
      queued += n;
      break;
    case JobStatus::Running:
      running += n;
      break;
    case JobStatus::Completed:
      completed += n;
      break;
    case JobStatus::Failed:
      failed += n;
      break;
    }
  }
};

// Durable job persistence; the single source of truth for job state.
// Implementations: storage::MySQLJobStore.
//
// Every successful write is committed before the coroutine completes.
// transition() is the only mutation after create(); it applies only if the
// persisted status (and, when given, attempt_count) still matches, and fails
// with Error::StaleTransition otherwise without touching the row.
class JobStore {
public:
  virtual ~JobStore() = default;

  virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> task<void> = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  /// Inserts `job` as Queued. Error::DuplicateId if the id exists.
  virtual auto create(const Job &job) -> task<Result<Job>> = 0;

  virtual auto transition(const JobId &id, JobStatus expected_status,
                          JobStatus new_status, const JobTransition &fields)
      -> task<Result<Job>> = 0;

  virtual auto get(const JobId &id) -> task<Result<Job>> = 0;

  /// Newest first (created_at desc, id desc).
  virtual auto list(const JobFilter &filter)
      -> task<Result<std::vector<Job>>> = 0;

  /// Ignores filter.limit.
  virtual auto count(const JobFilter &filter) -> task<Result<std::size_t>> = 0;

  /// Per-status totals from a single read.
  virtual auto count_by_status() -> task<Result<StatusCounts>> = 0;

  /// Administrative removal of one terminal job. InvalidState if the job is
  /// still queued or running.
  virtual auto purge(const JobId &id) -> task<Result<void>> = 0;

  /// Administrative removal of every terminal job; returns rows removed.
  virtual auto purge_terminal() -> task<Result<std::size_t>> = 0;
};

} // namespace banana
