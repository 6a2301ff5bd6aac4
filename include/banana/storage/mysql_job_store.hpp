#pragma once

#include "banana/config/app_config.hpp"
#include "banana/storage/job_store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

#include <atomic>

namespace banana::storage {

class MySQLJobStore final : public JobStore {
public:
  MySQLJobStore(boost::asio::any_io_executor executor,
                const DatabaseConfig &config);
  ~MySQLJobStore() override;

  MySQLJobStore(const MySQLJobStore &) = delete;
  MySQLJobStore &operator=(const MySQLJobStore &) = delete;

  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto create(const Job &job) -> task<Result<Job>> override;
  auto transition(const JobId &id, JobStatus expected_status,
                  JobStatus new_status, const JobTransition &fields)
      -> task<Result<Job>> override;
  auto get(const JobId &id) -> task<Result<Job>> override;
  auto list(const JobFilter &filter) -> task<Result<std::vector<Job>>> override;
  auto count(const JobFilter &filter) -> task<Result<std::size_t>> override;
  auto count_by_status() -> task<Result<StatusCounts>> override;
  auto purge(const JobId &id) -> task<Result<void>> override;
  auto purge_terminal() -> task<Result<std::size_t>> override;

private:
  auto ensure_database_exists() -> task<Result<void>>;
  auto get_connection() -> task<Result<boost::mysql::pooled_connection>>;
  auto ensure_schema(boost::mysql::any_connection &conn) -> task<Result<void>>;

  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  std::atomic<bool> open_{false};
};

} // namespace banana::storage
