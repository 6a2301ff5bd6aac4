#include "banana/storage/mysql_job_store.hpp"

#include "banana/storage/mysql_schema.hpp"
#include "banana/util/json.hpp"
#include "banana/util/log.hpp"
#include "banana/util/time.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/common_server_errc.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/error_with_diagnostics.hpp>
#include <boost/mysql/pipeline.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/row_view.hpp>
#include <boost/mysql/with_params.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace banana::storage {
namespace {

using boost::asio::use_awaitable;
using boost::mysql::with_params;

constexpr std::string_view kJobColumns =
    "job_id, kind, prompt, input_reference, parent_id, params, status, "
    "attempt_count, output_references, error_kind, error_detail, created_at, "
    "updated_at";

[[nodiscard]] auto split_sql_statements(std::string_view input)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < input.size()) {
    auto end = input.find(';', start);
    if (end == std::string_view::npos) {
      end = input.size();
    }
    auto stmt = input.substr(start, end - start);
    auto first = stmt.find_first_not_of(" \n\r\t");
    if (first != std::string_view::npos) {
      auto last = stmt.find_last_not_of(" \n\r\t");
      out.emplace_back(stmt.substr(first, last - first + 1));
    }
    start = end + 1;
  }
  return out;
}

[[nodiscard]] auto make_pool_params(const DatabaseConfig &cfg)
    -> boost::mysql::pool_params {
  boost::mysql::pool_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  params.database = cfg.database;
  params.initial_size = 1;
  params.max_size = std::max<std::size_t>(1, cfg.pool_size);
  params.thread_safe = true;
  params.connect_timeout = std::chrono::seconds(cfg.connect_timeout);
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

[[nodiscard]] auto as_i64(const boost::mysql::field_view &f) -> std::int64_t {
  if (f.is_int64()) {
    return f.as_int64();
  }
  if (f.is_uint64()) {
    return static_cast<std::int64_t>(f.as_uint64());
  }
  return 0;
}

[[nodiscard]] auto as_sv(const boost::mysql::field_view &f)
    -> std::string_view {
  if (!f.is_string()) {
    return {};
  }
  auto s = f.as_string();
  return std::string_view(s.data(), s.size());
}

[[nodiscard]] auto as_opt_str(const boost::mysql::field_view &f)
    -> std::optional<std::string> {
  if (f.is_null()) {
    return std::nullopt;
  }
  return std::string(as_sv(f));
}

[[nodiscard]] auto refs_to_json(const std::vector<std::string> &refs)
    -> std::string {
  auto out = glz::write_json(refs);
  return out ? *out : "[]";
}

[[nodiscard]] auto row_to_job(const boost::mysql::row_view &row) -> Job {
  Job job;
  job.id = JobId{as_sv(row.at(0))};
  job.kind = parse<JobKind>(as_sv(row.at(1)));
  job.prompt = std::string(as_sv(row.at(2)));
  job.input_reference = as_opt_str(row.at(3));
  if (auto parent = as_opt_str(row.at(4)); parent) {
    job.parent_id = JobId{std::move(*parent)};
  }
  if (auto params = params_from_json(as_sv(row.at(5))); params) {
    job.params = std::move(*params);
  } else {
    log::warn("Corrupt params JSON for job {}, using defaults", job.id);
  }
  job.status = parse<JobStatus>(as_sv(row.at(6)));
  job.attempt_count = static_cast<int>(as_i64(row.at(7)));
  if (auto refs = read_json_as<std::vector<std::string>>(as_sv(row.at(8)));
      refs) {
    job.output_references = std::move(*refs);
  }
  if (!row.at(9).is_null()) {
    job.error = ErrorSummary{
        .kind = parse<FailureKind>(as_sv(row.at(9))),
        .detail = std::string(as_sv(row.at(10))),
    };
  }
  job.created_at = util::from_unix_millis(as_i64(row.at(11)));
  job.updated_at = util::from_unix_millis(as_i64(row.at(12)));
  return job;
}

[[nodiscard]] auto status_or_null(const JobFilter &filter)
    -> std::optional<std::string_view> {
  if (!filter.status) {
    return std::nullopt;
  }
  return to_string_view(*filter.status);
}

[[nodiscard]] auto error_kind_or_null(const std::optional<ErrorSummary> &e)
    -> std::optional<std::string_view> {
  if (!e) {
    return std::nullopt;
  }
  return to_string_view(e->kind);
}

[[nodiscard]] auto error_detail_or_null(const std::optional<ErrorSummary> &e)
    -> std::optional<std::string_view> {
  if (!e) {
    return std::nullopt;
  }
  return std::string_view{e->detail};
}

template <typename F>
auto mysql_try(F &&f) -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const boost::mysql::error_with_diagnostics &e) {
    log::error("MySQL operation failed: {} ({})", e.what(),
               e.get_diagnostics().server_message());
    co_return fail(Error::DatabaseQueryFailed);
  } catch (const std::exception &e) {
    log::error("MySQL operation failed: {}", e.what());
    co_return fail(Error::DatabaseQueryFailed);
  }
}

} // namespace

MySQLJobStore::MySQLJobStore(boost::asio::any_io_executor executor,
                             const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySQLJobStore::~MySQLJobStore() { pool_.cancel(); }

auto MySQLJobStore::ensure_database_exists() -> task<Result<void>> {
  try {
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));

    boost::mysql::results res;
    co_await conn.async_execute(
        with_params("CREATE DATABASE IF NOT EXISTS {:i}", cfg_.database), res,
        use_awaitable);
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL ensure database '{}' failed: {}", cfg_.database,
               e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLJobStore::open() -> task<Result<void>> {
  if (open_.load(std::memory_order_acquire)) {
    co_return ok();
  }

  if (auto r = co_await ensure_database_exists(); !r) {
    co_return fail(r.error());
  }

  open_.store(true, std::memory_order_release);
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_.store(false, std::memory_order_release);
    co_return fail(conn_res.error());
  }
  if (auto r = co_await ensure_schema(conn_res->get()); !r) {
    open_.store(false, std::memory_order_release);
    co_return fail(r.error());
  }
  conn_res->return_without_reset();

  log::info("Job store opened: {}:{} / {}", cfg_.host, cfg_.port,
            cfg_.database);
  co_return ok();
}

auto MySQLJobStore::close() -> task<void> {
  if (open_.exchange(false, std::memory_order_acq_rel)) {
    pool_.cancel();
  }
  co_return;
}

auto MySQLJobStore::is_open() const noexcept -> bool {
  return open_.load(std::memory_order_acquire);
}

auto MySQLJobStore::get_connection()
    -> task<Result<boost::mysql::pooled_connection>> {
  if (!is_open()) {
    co_return fail(Error::SystemNotRunning);
  }
  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_return ok(std::move(conn));
  } catch (const std::exception &e) {
    log::error("MySQL get connection failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLJobStore::ensure_schema(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    boost::mysql::pipeline_request req;
    for (const auto &stmt : split_sql_statements(schema::V1_SCHEMA)) {
      req.add_execute(stmt);
    }
    req.add_execute("INSERT IGNORE INTO schema_version(version) VALUES (" +
                    std::to_string(schema::CURRENT_SCHEMA_VERSION) + ")");

    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn.async_run_pipeline(req, stage_responses, use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema ensure failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLJobStore::create(const Job &job) -> task<Result<Job>> {
  if (job.id.empty() || job.status != JobStatus::Queued ||
      !check_invariants(job)) {
    co_return fail(Error::InvalidArgument);
  }

  co_return co_await mysql_try([&]() -> task<Result<Job>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    std::optional<std::string_view> parent;
    if (job.parent_id) {
      parent = job.parent_id->value();
    }

    boost::mysql::results res;
    try {
      co_await conn_res->get().async_execute(
          with_params(
              "INSERT INTO jobs(job_id, kind, prompt, input_reference, "
              "parent_id, params, status, attempt_count, output_references, "
              "error_kind, error_detail, created_at, updated_at) "
              "VALUES({}, {}, {}, {}, {}, {}, {}, 0, '[]', NULL, NULL, {}, {})",
              job.id.str(), to_string_view(job.kind), job.prompt,
              job.input_reference, parent, params_to_json(job.params),
              to_string_view(JobStatus::Queued),
              util::to_unix_millis(job.created_at),
              util::to_unix_millis(job.updated_at)),
          res, use_awaitable);
    } catch (const boost::mysql::error_with_diagnostics &e) {
      if (e.code() == boost::mysql::common_server_errc::er_dup_entry) {
        conn_res->return_without_reset();
        co_return fail(Error::DuplicateId);
      }
      throw;
    }

    conn_res->return_without_reset();
    Job stored = job;
    stored.created_at = util::truncate_to_millis(job.created_at);
    stored.updated_at = util::truncate_to_millis(job.updated_at);
    co_return ok(std::move(stored));
  });
}

auto MySQLJobStore::transition(const JobId &id, JobStatus expected_status,
                               JobStatus new_status,
                               const JobTransition &fields)
    -> task<Result<Job>> {
  co_return co_await mysql_try([&]() -> task<Result<Job>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results res;
    auto rollback = [&](Error e) -> task<Result<Job>> {
      co_await conn.async_execute("ROLLBACK", res, use_awaitable);
      conn_res->return_without_reset();
      co_return fail(e);
    };

    co_await conn.async_execute("START TRANSACTION", res, use_awaitable);
    co_await conn.async_execute(
        with_params("SELECT {:r} FROM jobs WHERE job_id = {} FOR UPDATE",
                    kJobColumns, id.str()),
        res, use_awaitable);
    if (res.rows().empty()) {
      co_return co_await rollback(Error::NotFound);
    }

    const Job current = row_to_job(res.rows().at(0));
    if (current.status != expected_status ||
        (fields.expected_attempt_count &&
         current.attempt_count != *fields.expected_attempt_count)) {
      co_return co_await rollback(Error::StaleTransition);
    }

    auto next = apply_transition(current, new_status, fields);
    if (!next) {
      log::warn("Rejected transition {} {} -> {}: {}", id,
                to_string_view(current.status), to_string_view(new_status),
                next.error().message());
      co_return co_await rollback(Error::InvalidState);
    }
    next->updated_at = util::truncate_to_millis(next->updated_at);

    co_await conn.async_execute(
        with_params(
            "UPDATE jobs SET status = {}, attempt_count = {}, "
            "output_references = {}, error_kind = {}, error_detail = {}, "
            "updated_at = {} WHERE job_id = {}",
            to_string_view(next->status), next->attempt_count,
            refs_to_json(next->output_references),
            error_kind_or_null(next->error), error_detail_or_null(next->error),
            util::to_unix_millis(next->updated_at), id.str()),
        res, use_awaitable);
    co_await conn.async_execute("COMMIT", res, use_awaitable);

    conn_res->return_without_reset();
    co_return ok(std::move(*next));
  });
}

auto MySQLJobStore::get(const JobId &id) -> task<Result<Job>> {
  co_return co_await mysql_try([&]() -> task<Result<Job>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        with_params("SELECT {:r} FROM jobs WHERE job_id = {}", kJobColumns,
                    id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(row_to_job(res.rows().at(0)));
  });
}

auto MySQLJobStore::list(const JobFilter &filter)
    -> task<Result<std::vector<Job>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Job>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const auto status = status_or_null(filter);
    const std::uint64_t limit =
        filter.limit == 0 ? std::numeric_limits<std::uint64_t>::max()
                          : static_cast<std::uint64_t>(filter.limit);

    // A NULL status and an empty prefix match every row. One statement, so
    // InnoDB serves it from a single consistent read view.
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        with_params("SELECT {:r} FROM jobs WHERE "
                    "({} IS NULL OR status = {}) AND LEFT(job_id, {}) = {} "
                    "ORDER BY created_at DESC, job_id DESC LIMIT {}",
                    kJobColumns, status, status, filter.id_prefix.size(),
                    filter.id_prefix, limit),
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<Job> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(row_to_job(row));
    }
    co_return ok(std::move(out));
  });
}

auto MySQLJobStore::count(const JobFilter &filter)
    -> task<Result<std::size_t>> {
  co_return co_await mysql_try([&]() -> task<Result<std::size_t>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const auto status = status_or_null(filter);
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        with_params("SELECT COUNT(*) FROM jobs WHERE "
                    "({} IS NULL OR status = {}) AND LEFT(job_id, {}) = {}",
                    status, status, filter.id_prefix.size(), filter.id_prefix),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(static_cast<std::size_t>(as_i64(res.rows().at(0).at(0))));
  });
}

auto MySQLJobStore::count_by_status() -> task<Result<StatusCounts>> {
  co_return co_await mysql_try([&]() -> task<Result<StatusCounts>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        "SELECT status, COUNT(*) FROM jobs GROUP BY status", res,
        use_awaitable);
    conn_res->return_without_reset();

    StatusCounts counts;
    for (const auto &row : res.rows()) {
      auto status = util::try_parse_enum<JobStatus>(as_sv(row.at(0)));
      if (!status) {
        log::warn("Ignoring {} job(s) with unknown status '{}'",
                  as_i64(row.at(1)), as_sv(row.at(0)));
        continue;
      }
      counts.add(*status, static_cast<std::size_t>(as_i64(row.at(1))));
    }
    co_return counts;
  });
}

auto MySQLJobStore::purge(const JobId &id) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        with_params("DELETE FROM jobs WHERE job_id = {} AND status IN ({}, {})",
                    id.str(), to_string_view(JobStatus::Completed),
                    to_string_view(JobStatus::Failed)),
        res, use_awaitable);

    if (res.affected_rows() == 0) {
      boost::mysql::results exists_res;
      co_await conn_res->get().async_execute(
          with_params("SELECT EXISTS(SELECT 1 FROM jobs WHERE job_id = {})",
                      id.str()),
          exists_res, use_awaitable);
      conn_res->return_without_reset();
      if (as_i64(exists_res.rows().at(0).at(0)) == 0) {
        co_return fail(Error::NotFound);
      }
      co_return fail(Error::InvalidState);
    }

    conn_res->return_without_reset();
    log::info("Purged job {}", id);
    co_return ok();
  });
}

auto MySQLJobStore::purge_terminal() -> task<Result<std::size_t>> {
  co_return co_await mysql_try([&]() -> task<Result<std::size_t>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        with_params("DELETE FROM jobs WHERE status IN ({}, {})",
                    to_string_view(JobStatus::Completed),
                    to_string_view(JobStatus::Failed)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(static_cast<std::size_t>(res.affected_rows()));
  });
}

} // namespace banana::storage
