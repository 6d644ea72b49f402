#include <future>
#include <gtest/gtest.h>
#include <codebox/executor.h>
#include <codebox/submission.h>
#include "utils.h"

namespace {

std::vector<SubmissionState> RunAndRecord(const std::string& source, AgentResponse& resp) {
  std::vector<SubmissionState> states;
  CodeSubmission sub;
  sub.source = source;
  sub.reporter.ReportState = [&states](const CodeSubmission&, SubmissionState state) {
    states.push_back(state);
  };
  resp = RunSubmission(sub);
  return states;
}

} // namespace

TEST(Submission, RejectedNeverExecutes) {
  long before = ExecutionsStarted();
  AgentResponse resp;
  auto states = RunAndRecord("import os\nos.system('ls')\n", resp);
  std::vector<SubmissionState> expected = {
    SubmissionState::RECEIVED, SubmissionState::VALIDATING, SubmissionState::REJECTED};
  EXPECT_EQ(states, expected);
  EXPECT_FALSE(resp.ok);
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::VALIDATION_REJECTED);
  EXPECT_EQ(ExecutionsStarted(), before);
}

TEST(Submission, SyntaxErrorNeverExecutes) {
  long before = ExecutionsStarted();
  AgentResponse resp;
  auto states = RunAndRecord("def f(:\n  pass\n", resp);
  ASSERT_FALSE(states.empty());
  EXPECT_EQ(states.back(), SubmissionState::REJECTED);
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::SYNTAX_INVALID);
  EXPECT_EQ(ExecutionsStarted(), before);
}

TEST(Submission, QueuedSubmissionIsFinalized) {
  StartWorkLoop();
  std::promise<AgentResponse> done;
  CodeSubmission sub;
  sub.request_id = "q1";
  sub.source = "eval('1')";
  sub.reporter.ReportFinalized = [&done](const CodeSubmission& finished, const AgentResponse& resp) {
    EXPECT_EQ(finished.request_id, "q1");
    EXPECT_NE(finished.submission_internal_id, 0);
    done.set_value(resp);
  };
  ASSERT_TRUE(PushSubmission(std::move(sub)));
  auto fut = done.get_future();
  ASSERT_EQ(fut.wait_for(std::chrono::seconds(30)), std::future_status::ready);
  AgentResponse resp = fut.get();
  EXPECT_FALSE(resp.ok);
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::VALIDATION_REJECTED);
  WaitIdle();
}

TEST(Submission, QueueBound) {
  ASSERT_EQ(kMaxParallel, 1);
  StartWorkLoop();
  WaitIdle();
  long before = ExecutionsStarted();

  std::promise<void> started, release;
  std::shared_future<void> release_fut = release.get_future().share();
  CodeSubmission blocker;
  blocker.source = "import subprocess";
  blocker.reporter.ReportState = [&started, release_fut](const CodeSubmission&, SubmissionState state) {
    if (state != SubmissionState::RECEIVED) return;
    started.set_value();
    release_fut.wait();
  };
  ASSERT_TRUE(PushSubmission(std::move(blocker), 1));
  started.get_future().wait();

  CodeSubmission queued;
  queued.source = "open('x')";
  ASSERT_TRUE(PushSubmission(std::move(queued), 1));
  EXPECT_EQ(CurrentSubmissionQueueSize(), 1u);

  CodeSubmission refused;
  refused.source = "1";
  EXPECT_FALSE(PushSubmission(std::move(refused), 1));

  release.set_value();
  WaitIdle();
  EXPECT_EQ(CurrentSubmissionQueueSize(), 0u);
  EXPECT_EQ(ExecutionsStarted(), before);
}
