#include "banana/query/job_query.hpp"

#include "banana/core/runtime.hpp"
#include "banana/util/log.hpp"

namespace banana {

JobQuery::JobQuery(Runtime &runtime, JobStore &store)
    : runtime_(runtime), store_(store) {}

auto JobQuery::list(JobFilter filter) -> task<Result<std::vector<Job>>> {
  co_return co_await store_.list(filter);
}

auto JobQuery::get(JobId id) -> task<Result<Job>> {
  co_return co_await store_.get(id);
}

auto JobQuery::count(JobFilter filter) -> task<Result<std::size_t>> {
  co_return co_await store_.count(filter);
}

auto JobQuery::status_counts() -> task<Result<StatusCounts>> {
  co_return co_await store_.count_by_status();
}

template <typename T>
auto JobQuery::block(task<Result<T>> op) -> Result<T> {
  if (runtime_.in_runtime_thread()) {
    log::error("Blocking job query issued from a runtime thread");
    return fail(Error::InvalidState);
  }
  if (!runtime_.is_running()) {
    return fail(Error::SystemNotRunning);
  }
  return runtime_.block_on(std::move(op));
}

auto JobQuery::list_blocking(JobFilter filter) -> Result<std::vector<Job>> {
  return block(list(std::move(filter)));
}

auto JobQuery::get_blocking(JobId id) -> Result<Job> {
  return block(get(std::move(id)));
}

auto JobQuery::count_blocking(JobFilter filter) -> Result<std::size_t> {
  return block(count(std::move(filter)));
}

auto JobQuery::status_counts_blocking() -> Result<StatusCounts> {
  return block(status_counts());
}

} // namespace banana
