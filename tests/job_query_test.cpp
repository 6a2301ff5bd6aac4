#include "banana/core/runtime.hpp"
#include "banana/query/job_query.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace banana;
using namespace banana::test;
using namespace std::chrono_literals;

class JobQueryTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(runtime_.start().has_value());
    const auto base = util::Clock::now() - 1h;

    store_.put(make_queued_job("bn_000000a1", base));

    auto running = make_queued_job("bn_000000b1", base + 1min);
    running.status = JobStatus::Running;
    running.attempt_count = 1;
    store_.put(running);

    auto done = make_queued_job("bn_000000b2", base + 2min);
    done.status = JobStatus::Completed;
    done.attempt_count = 1;
    done.output_references = {"/tmp/out.png"};
    store_.put(done);

    auto failed = make_queued_job("bn_000000c1", base + 3min);
    failed.status = JobStatus::Failed;
    failed.attempt_count = 3;
    failed.error = ErrorSummary{.kind = FailureKind::TransientExhausted,
                                .detail = "HTTP 503 (after 3 attempts)"};
    store_.put(failed);
  }

  void TearDown() override { runtime_.stop(); }

  Runtime runtime_{2};
  FakeJobStore store_;
  JobQuery query_{runtime_, store_};
};

TEST_F(JobQueryTest, ListIsNewestFirst) {
  auto jobs = query_.list_blocking({});
  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 4u);
  EXPECT_EQ((*jobs)[0].id, JobId{"bn_000000c1"});
  EXPECT_EQ((*jobs)[3].id, JobId{"bn_000000a1"});
}

TEST_F(JobQueryTest, ListAppliesFilterAndLimit) {
  auto failed = query_.list_blocking({.status = JobStatus::Failed});
  ASSERT_TRUE(failed.has_value());
  ASSERT_EQ(failed->size(), 1u);
  EXPECT_EQ(failed->front().error->kind, FailureKind::TransientExhausted);

  auto prefixed = query_.list_blocking({.id_prefix = "bn_000000b"});
  ASSERT_TRUE(prefixed.has_value());
  EXPECT_EQ(prefixed->size(), 2u);

  auto limited = query_.list_blocking({.limit = 2});
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 2u);
}

TEST_F(JobQueryTest, CountIgnoresLimit) {
  auto n = query_.count_blocking({.limit = 1});
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(*n, 4u);
}

TEST_F(JobQueryTest, StatusCounts) {
  auto counts = query_.status_counts_blocking();
  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(counts->queued, 1u);
  EXPECT_EQ(counts->running, 1u);
  EXPECT_EQ(counts->completed, 1u);
  EXPECT_EQ(counts->failed, 1u);
  EXPECT_EQ(counts->total(), 4u);
  EXPECT_EQ(counts->of(JobStatus::Running), 1u);
}

TEST_F(JobQueryTest, StatusCountsComeFromOneRead) {
  auto counts = query_.status_counts_blocking();
  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(store_.count_by_status_calls(), 1);
  EXPECT_EQ(store_.count_calls(), 0);
}

TEST_F(JobQueryTest, GetMissingJob) {
  auto job = query_.get_blocking(JobId{"bn_ffffffff"});
  ASSERT_FALSE(job.has_value());
  EXPECT_EQ(job.error(), make_error_code(Error::NotFound));
}

TEST_F(JobQueryTest, CoroutineFormsWorkInsideRuntime) {
  auto job = runtime_.block_on(query_.get(JobId{"bn_000000b2"}));
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->output_references.size(), 1u);
}

TEST_F(JobQueryTest, BlockingFormRejectedOnRuntimeThread) {
  auto from_worker = [this]() -> task<std::error_code> {
    auto jobs = query_.list_blocking({});
    co_return jobs ? std::error_code{} : jobs.error();
  };
  auto ec = runtime_.block_on(from_worker());
  EXPECT_EQ(ec, make_error_code(Error::InvalidState));
}

TEST_F(JobQueryTest, BlockingFormNeedsRunningRuntime) {
  runtime_.stop();
  auto jobs = query_.list_blocking({});
  ASSERT_FALSE(jobs.has_value());
  EXPECT_EQ(jobs.error(), make_error_code(Error::SystemNotRunning));
}
