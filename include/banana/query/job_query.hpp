#pragma once

#include "banana/core/coroutine.hpp"
#include "banana/core/error.hpp"
#include "banana/job/job.hpp"
#include "banana/storage/job_store.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace banana {

class Runtime;

// Read-only view of job history for the CLI and the live view. Each call is
// a single store read; rows are never torn, and readers never block the
// engine's writes.
//
// The blocking forms run the read on the runtime and wait for it, so they
// must not be called from a runtime thread.
class JobQuery {
public:
  JobQuery(Runtime &runtime, JobStore &store);

  auto list(JobFilter filter) -> task<Result<std::vector<Job>>>;
  auto get(JobId id) -> task<Result<Job>>;
  auto count(JobFilter filter) -> task<Result<std::size_t>>;
  auto status_counts() -> task<Result<StatusCounts>>;

  [[nodiscard]] auto list_blocking(JobFilter filter)
      -> Result<std::vector<Job>>;
  [[nodiscard]] auto get_blocking(JobId id) -> Result<Job>;
  [[nodiscard]] auto count_blocking(JobFilter filter) -> Result<std::size_t>;
  [[nodiscard]] auto status_counts_blocking() -> Result<StatusCounts>;

private:
  template <typename T> [[nodiscard]] auto block(task<Result<T>> op) -> Result<T>;

  Runtime &runtime_;
  JobStore &store_;
};

} // namespace banana
