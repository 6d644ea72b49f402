#include <codebox/submission.h>

#include <sys/stat.h>
#include <mutex>
#include <queue>
#include <thread>
#include <stdexcept>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <codebox/executor.h>
#include <codebox/namespace.h>
#include <codebox/result.h>
#include <codebox/validator.h>
#include "utils.h"

int kMaxParallel = 1;
cpu_set_t kPinnedCpus = {};

namespace {

std::mutex task_mtx;
std::condition_variable task_cv, idle_cv;
std::queue<CodeSubmission> submission_queue;
int running = 0;

void Report(const CodeSubmission& sub, SubmissionState state) {
  spdlog::info("Submission state: id={} request={} state={}",
               sub.submission_internal_id, sub.request_id, SubmissionStateName(state));
  if (sub.reporter.ReportState) sub.reporter.ReportState(sub, state);
}

SubmissionState FinalState(const ExecutionOutcome& outcome) {
  switch (outcome.index()) {
    case 0: return SubmissionState::COMPLETED;
    case 1: return SubmissionState::RUNTIME_FAILURE;
    case 2: return SubmissionState::TIMED_OUT;
    case 3: return SubmissionState::RESOURCE_EXCEEDED;
    case 4: return SubmissionState::KILLED;
    case 5: return SubmissionState::SANDBOX_ERROR;
  }
  __builtin_unreachable();
}

void Finish(CodeSubmission&& sub) {
  AgentResponse resp = RunSubmission(sub);
  if (sub.reporter.ReportFinalized) sub.reporter.ReportFinalized(sub, resp);
  std::lock_guard lck(task_mtx);
  running--;
  task_cv.notify_all();
  idle_cv.notify_all();
}

} // namespace

AgentResponse RunSubmission(const CodeSubmission& sub) {
  Report(sub, SubmissionState::RECEIVED);
  Report(sub, SubmissionState::VALIDATING);
  ValidationVerdict verdict = Validate(sub.source);
  if (!verdict.accepted) {
    spdlog::info("Submission rejected: id={} violations={}", sub.submission_internal_id,
                 verdict.violations.size());
    Report(sub, SubmissionState::REJECTED);
    return Assemble(verdict);
  }
  Report(sub, SubmissionState::VALIDATED);
  ExecutionContext ctx = BuildNamespace(sub, verdict);
  ResourceLimits limits = ResolveLimits(sub.limits);
  Report(sub, SubmissionState::EXECUTING);
  ExecutionOutcome outcome = Execute(sub.source, ctx, limits);
  Report(sub, FinalState(outcome));
  return Assemble(outcome);
}

void WorkLoop(bool loop) {
  umask(0022);
  std::unique_lock lck(task_mtx);
  do {
    task_cv.wait(lck, []{ return !submission_queue.empty(); });
    while (!submission_queue.empty()) {
      if (running >= kMaxParallel) {
        task_cv.wait(lck);
        continue;
      }
      CodeSubmission sub = std::move(submission_queue.front());
      submission_queue.pop();
      running++;
      spdlog::debug("Dispatching submission: id={} running={}", sub.submission_internal_id, running);
      std::thread(Finish, std::move(sub)).detach();
    }
  } while (loop);
}

void WaitIdle() {
  std::unique_lock lck(task_mtx);
  idle_cv.wait(lck, []{ return submission_queue.empty() && running == 0; });
}

size_t CurrentSubmissionQueueSize() {
  std::lock_guard lck(task_mtx);
  return submission_queue.size();
}

bool PushSubmission(CodeSubmission&& sub, size_t max_queue) {
  std::unique_lock lck(task_mtx);
  if (max_queue > 0 && submission_queue.size() >= max_queue) return false;
  if (!sub.submission_internal_id) sub.submission_internal_id = GetUniqueSubmissionInternalId();
  spdlog::info("Submission enqueued: id={} request={}", sub.submission_internal_id, sub.request_id);
  submission_queue.push(std::move(sub));
  lck.unlock();
  task_cv.notify_one();
  return true;
}
