#include "banana/job/job.hpp"

#include "gtest/gtest.h"

#include <chrono>

using namespace banana;

namespace {

auto running_job(int attempts) -> Job {
  Job job;
  job.id = JobId{"bn_0000abcd"};
  job.prompt = "a banana";
  job.status = JobStatus::Running;
  job.attempt_count = attempts;
  return job;
}

} // namespace

TEST(JobStatusTest, SnakeCaseNames) {
  EXPECT_EQ(to_string_view(JobStatus::Queued), "queued");
  EXPECT_EQ(to_string_view(JobStatus::Completed), "completed");
  EXPECT_EQ(to_string_view(FailureKind::TransientExhausted),
            "transient_exhausted");
  EXPECT_EQ(util::try_parse_enum<JobStatus>("failed"), JobStatus::Failed);
  EXPECT_EQ(util::try_parse_enum<JobStatus>("Running"), JobStatus::Running);
  EXPECT_FALSE(util::try_parse_enum<JobStatus>("done").has_value());
}

TEST(JobStatusTest, TerminalStates) {
  EXPECT_FALSE(is_terminal(JobStatus::Queued));
  EXPECT_FALSE(is_terminal(JobStatus::Running));
  EXPECT_TRUE(is_terminal(JobStatus::Completed));
  EXPECT_TRUE(is_terminal(JobStatus::Failed));
}

TEST(JobStatusTest, AllowedEdges) {
  EXPECT_TRUE(is_allowed_edge(JobStatus::Queued, JobStatus::Running));
  EXPECT_TRUE(is_allowed_edge(JobStatus::Running, JobStatus::Running));
  EXPECT_TRUE(is_allowed_edge(JobStatus::Running, JobStatus::Completed));
  EXPECT_FALSE(is_allowed_edge(JobStatus::Queued, JobStatus::Completed));
  EXPECT_FALSE(is_allowed_edge(JobStatus::Running, JobStatus::Queued));
  EXPECT_FALSE(is_allowed_edge(JobStatus::Completed, JobStatus::Running));
  EXPECT_FALSE(is_allowed_edge(JobStatus::Failed, JobStatus::Failed));
}

TEST(JobIdTest, GeneratedIdsHaveExpectedShape) {
  auto id = generate_job_id();
  EXPECT_TRUE(id.value().starts_with("bn_"));
  EXPECT_EQ(id.value().size(), 11u);
  EXPECT_TRUE(is_valid_job_id(id.value()));
  EXPECT_NE(generate_job_id(), id);
}

TEST(JobIdTest, RejectsMalformedIds) {
  EXPECT_FALSE(is_valid_job_id(""));
  EXPECT_FALSE(is_valid_job_id("bn_123"));
  EXPECT_FALSE(is_valid_job_id("bn_ABCDEF12"));
  EXPECT_FALSE(is_valid_job_id("xx_abcdef12"));
  EXPECT_TRUE(is_valid_job_id("bn_abcdef12"));
}

TEST(GenerationParamsTest, DefaultsAreValid) {
  EXPECT_TRUE(validate_params(GenerationParams{}).has_value());
}

TEST(GenerationParamsTest, RejectsUnsupportedValues) {
  GenerationParams p;
  p.aspect_ratio = "7:3";
  EXPECT_EQ(validate_params(p).error(), make_error_code(Error::InvalidArgument));

  p = {};
  p.size = "8K";
  EXPECT_FALSE(validate_params(p).has_value());

  p = {};
  p.model = "dall-e-3";
  EXPECT_FALSE(validate_params(p).has_value());

  p = {};
  p.num_images = 0;
  EXPECT_FALSE(validate_params(p).has_value());
  p.num_images = kMaxImages + 1;
  EXPECT_FALSE(validate_params(p).has_value());

  p = {};
  p.output_directory.clear();
  EXPECT_FALSE(validate_params(p).has_value());
}

TEST(GenerationParamsTest, JsonKeepsOptionalFields) {
  GenerationParams p;
  p.aspect_ratio = "16:9";
  p.size = "2K";
  p.num_images = 3;
  p.seed = 42;
  p.negative_prompt = "blurry";
  p.output_directory = "/tmp/out";

  auto parsed = params_from_json(params_to_json(p));
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
  EXPECT_EQ(*parsed, p);
}

TEST(GenerationParamsTest, MalformedJsonIsRejected) {
  EXPECT_FALSE(params_from_json("{not json").has_value());
}

TEST(JobInvariantTest, QueuedJobHasNoAttempts) {
  Job job;
  job.id = JobId{"bn_00000001"};
  EXPECT_TRUE(check_invariants(job).has_value());
  job.attempt_count = 1;
  EXPECT_FALSE(check_invariants(job).has_value());
}

TEST(JobInvariantTest, CompletedRequiresOutputs) {
  auto job = running_job(1);
  job.status = JobStatus::Completed;
  EXPECT_FALSE(check_invariants(job).has_value());
  job.output_references = {"/tmp/a.png"};
  EXPECT_TRUE(check_invariants(job).has_value());
}

TEST(JobInvariantTest, FailedRequiresError) {
  auto job = running_job(2);
  job.status = JobStatus::Failed;
  EXPECT_FALSE(check_invariants(job).has_value());
  job.error = ErrorSummary{.kind = FailureKind::Permanent, .detail = "x"};
  EXPECT_TRUE(check_invariants(job).has_value());
}

TEST(ApplyTransitionTest, ClaimSetsFirstAttempt) {
  Job job;
  job.id = JobId{"bn_00000002"};
  job.prompt = "p";

  JobTransition fields;
  fields.attempt_count = 1;
  auto next = apply_transition(job, JobStatus::Running, fields);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->status, JobStatus::Running);
  EXPECT_EQ(next->attempt_count, 1);
  EXPECT_GT(next->updated_at, job.updated_at);
}

TEST(ApplyTransitionTest, UpdatedAtStrictlyIncreases) {
  auto job = running_job(1);
  job.updated_at = util::Clock::now() + std::chrono::hours{1};

  JobTransition fields;
  fields.attempt_count = 2;
  fields.updated_at = util::Clock::now();
  auto next = apply_transition(job, JobStatus::Running, fields);
  ASSERT_TRUE(next.has_value());
  EXPECT_GT(next->updated_at, job.updated_at);
}

TEST(ApplyTransitionTest, QueuedToFailedOnlyForCancellation) {
  Job job;
  job.id = JobId{"bn_00000003"};

  JobTransition fields;
  fields.error = ErrorSummary{.kind = FailureKind::Permanent, .detail = "x"};
  EXPECT_EQ(apply_transition(job, JobStatus::Failed, fields).error(),
            make_error_code(Error::InvalidState));

  fields.error = ErrorSummary{.kind = FailureKind::Cancelled, .detail = "x"};
  auto next = apply_transition(job, JobStatus::Failed, fields);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->attempt_count, 0);
}

TEST(ApplyTransitionTest, AttemptCountNeverDecreases) {
  auto job = running_job(2);
  JobTransition fields;
  fields.attempt_count = 1;
  EXPECT_FALSE(apply_transition(job, JobStatus::Running, fields).has_value());
}

TEST(ApplyTransitionTest, TerminalJobsAcceptNothing) {
  auto job = running_job(1);
  job.status = JobStatus::Completed;
  job.output_references = {"/tmp/a.png"};

  JobTransition fields;
  fields.attempt_count = 1;
  fields.error = ErrorSummary{.kind = FailureKind::Cancelled, .detail = "x"};
  EXPECT_EQ(apply_transition(job, JobStatus::Failed, fields).error(),
            make_error_code(Error::InvalidState));
}

TEST(ApplyTransitionTest, CompleteWithoutOutputsIsRejected) {
  auto job = running_job(1);
  JobTransition fields;
  fields.attempt_count = 1;
  EXPECT_FALSE(
      apply_transition(job, JobStatus::Completed, fields).has_value());
}

TEST(JobFilterTest, MatchesStatusAndPrefix) {
  auto job = running_job(1);
  EXPECT_TRUE(JobFilter{}.matches(job));
  EXPECT_TRUE(JobFilter{.status = JobStatus::Running}.matches(job));
  EXPECT_FALSE(JobFilter{.status = JobStatus::Queued}.matches(job));
  EXPECT_TRUE(JobFilter{.id_prefix = "bn_0000"}.matches(job));
  EXPECT_FALSE(JobFilter{.id_prefix = "bn_ff"}.matches(job));
}

TEST(PromptPreviewTest, ShortPromptUnchanged) {
  EXPECT_EQ(prompt_preview("a banana", 38), "a banana");
}

TEST(PromptPreviewTest, LongPromptIsCut) {
  auto out = prompt_preview(std::string(50, 'x'), 10);
  EXPECT_EQ(out, "xxxxxxx...");
  EXPECT_EQ(out.size(), 10u);
}

TEST(PromptPreviewTest, NewlinesFlattened) {
  EXPECT_EQ(prompt_preview("one\ntwo", 38), "one two");
}
