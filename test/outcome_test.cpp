#include <csignal>
#include <gtest/gtest.h>

#include "codebox/outcome.h"

namespace {

RunRecord Reported(int exit_code) {
  RunRecord rec;
  rec.reported = true;
  rec.exit_code = exit_code;
  rec.elapsed = 0.5;
  return rec;
}

FinishReport Finish(const std::string& status) {
  FinishReport fin;
  fin.status = status;
  return fin;
}

} // namespace

TEST(ExceptionSummary, Format) {
  EXPECT_EQ(FormatExceptionSummary("ValueError", "boom", 3), "ValueError: boom (line 3)");
  EXPECT_EQ(FormatExceptionSummary("KeyError", "", 0), "KeyError");
  EXPECT_EQ(FormatExceptionSummary("", "odd", 0), "Exception: odd");
}

TEST(ExceptionSummary, Bounded) {
  std::string summary = FormatExceptionSummary("RuntimeError", std::string(5000, 'x'), 7);
  EXPECT_EQ(summary.size(), 2000u);
  EXPECT_EQ(summary.compare(0, 14, "RuntimeError: "), 0);
  EXPECT_EQ(summary.substr(summary.size() - 12), "... (line 7)");
}

TEST(Classify, SetupErrorFirst) {
  RunRecord rec;
  rec.setup_error = "cannot mount";
  rec.deadline_hit = true;
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<SandboxError>(outcome));
  EXPECT_EQ(std::get<SandboxError>(outcome).message, "cannot mount");
}

TEST(Classify, DeadlineBeatsEverythingElse) {
  RunRecord rec = Reported(0);
  rec.deadline_hit = true;
  rec.oom_killed = true;
  rec.cpu_exceeded = true;
  rec.term_signal = SIGKILL;
  rec.elapsed = 3.25;
  rec.output = "partial";
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<TimedOut>(outcome));
  EXPECT_DOUBLE_EQ(std::get<TimedOut>(outcome).elapsed, 3.25);
  EXPECT_EQ(std::get<TimedOut>(outcome).stdout_text, "partial");
}

TEST(Classify, OomKill) {
  RunRecord rec = Reported(0);
  rec.oom_killed = true;
  rec.term_signal = SIGKILL;
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<ResourceExceeded>(outcome));
  EXPECT_EQ(std::get<ResourceExceeded>(outcome).kind, ResourceKind::MEMORY);
}

TEST(Classify, CpuLimit) {
  RunRecord rec = Reported(0);
  rec.cpu_exceeded = true;
  rec.term_signal = SIGXCPU;
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<ResourceExceeded>(outcome));
  EXPECT_EQ(std::get<ResourceExceeded>(outcome).kind, ResourceKind::CPU);
}

TEST(Classify, Completed) {
  RunRecord rec = Reported(0);
  rec.finish = Finish("ok");
  rec.finish->summary = "3";
  rec.output = "hi\n";
  rec.artifacts.push_back({"json", "out.json", "store://out.json"});
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<Completed>(outcome));
  auto& res = std::get<Completed>(outcome);
  EXPECT_EQ(res.stdout_text, "hi\n");
  EXPECT_EQ(res.return_summary, "3");
  ASSERT_EQ(res.artifacts.size(), 1u);
  EXPECT_EQ(res.artifacts[0].locator, "store://out.json");
}

TEST(Classify, UnhandledException) {
  RunRecord rec = Reported(1);
  rec.finish = Finish("error");
  rec.finish->type = "ZeroDivisionError";
  rec.finish->message = "division by zero";
  rec.finish->line = 2;
  rec.output = "before\n";
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<RuntimeFailure>(outcome));
  EXPECT_EQ(std::get<RuntimeFailure>(outcome).exception_summary, "ZeroDivisionError: division by zero (line 2)");
  EXPECT_EQ(std::get<RuntimeFailure>(outcome).stdout_text, "before\n");
}

TEST(Classify, MemoryErrorInInterpreter) {
  RunRecord rec = Reported(1);
  rec.finish = Finish("memory");
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<ResourceExceeded>(outcome));
  EXPECT_EQ(std::get<ResourceExceeded>(outcome).kind, ResourceKind::MEMORY);
}

TEST(Classify, NamespaceSetupFailure) {
  RunRecord rec = Reported(2);
  rec.finish = Finish("setup");
  rec.finish->message = "RuntimeError: binding mismatch";
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<SandboxError>(outcome));
  EXPECT_EQ(std::get<SandboxError>(outcome).message, "namespace setup failed: RuntimeError: binding mismatch");
}

TEST(Classify, ForeignSignal) {
  RunRecord rec = Reported(0);
  rec.term_signal = SIGSEGV;
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<Killed>(outcome));
  EXPECT_EQ(std::get<Killed>(outcome).signal, SIGSEGV);
}

TEST(Classify, TerminatedWithoutDeadline) {
  auto outcome = ClassifyOutcome(Reported(128 + SIGTERM));
  ASSERT_TRUE(std::holds_alternative<Killed>(outcome));
  EXPECT_EQ(std::get<Killed>(outcome).signal, SIGTERM);
}

TEST(Classify, HelperDied) {
  RunRecord rec;
  rec.reported = false;
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<SandboxError>(outcome));
}

TEST(Classify, ExitWithoutReport) {
  RunRecord rec = Reported(3);
  rec.output = "out";
  auto outcome = ClassifyOutcome(rec);
  ASSERT_TRUE(std::holds_alternative<RuntimeFailure>(outcome));
  EXPECT_EQ(std::get<RuntimeFailure>(outcome).exception_summary,
            "interpreter exited with status 3 without reporting a result");
  EXPECT_EQ(std::get<RuntimeFailure>(outcome).stdout_text, "out");
}

TEST(Classify, UnknownFinishStatus) {
  RunRecord rec = Reported(0);
  rec.finish = Finish("weird");
  auto outcome = ClassifyOutcome(rec);
  EXPECT_TRUE(std::holds_alternative<RuntimeFailure>(outcome));
}
