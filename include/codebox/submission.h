#ifndef INCLUDE_CODEBOX_SUBMISSION_H_
#define INCLUDE_CODEBOX_SUBMISSION_H_

#include <map>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <functional>

#include <sched.h>

extern int kMaxParallel;
extern cpu_set_t kPinnedCpus;

#define ENUM_VIOLATION_RULE_ \
  X(SYNTAX_ERROR, "syntax-error") \
  X(IMPORT, "import") \
  X(DYNAMIC_EVAL, "dynamic-eval") \
  X(FILESYSTEM_PROCESS, "filesystem-process") \
  X(UNSAFE_DESERIALIZATION, "unsafe-deserialization") \
  X(UNKNOWN_NAME, "unknown-name") \
  X(RESTRICTED_MEMBER, "restricted-member") \
  X(UNSUPPORTED, "unsupported-construct")
enum class ViolationRule {
#define X(name, desc) name,
  ENUM_VIOLATION_RULE_
#undef X
};

#define ENUM_RESOURCE_KIND_ \
  X(MEMORY, "memory") \
  X(CPU, "cpu")
enum class ResourceKind {
#define X(name, desc) name,
  ENUM_RESOURCE_KIND_
#undef X
};

// the order follows the state machine; everything after VALIDATED is terminal
#define ENUM_SUBMISSION_STATE_ \
  X(RECEIVED) \
  X(VALIDATING) \
  X(VALIDATED) \
  X(EXECUTING) \
  X(REJECTED) \
  X(COMPLETED) \
  X(RUNTIME_FAILURE) \
  X(TIMED_OUT) \
  X(RESOURCE_EXCEEDED) \
  X(KILLED) \
  X(SANDBOX_ERROR)
enum class SubmissionState {
#define X(name) name,
  ENUM_SUBMISSION_STATE_
#undef X
};

#define ENUM_ERROR_KIND_ \
  X(VALIDATION_REJECTED, "validation_rejected") \
  X(SYNTAX_INVALID, "syntax_invalid") \
  X(RUNTIME_FAILURE, "runtime_failure") \
  X(TIMED_OUT, "timed_out") \
  X(RESOURCE_EXCEEDED, "resource_exceeded") \
  X(KILLED_EXTERNALLY, "killed_externally") \
  X(SANDBOX_ERROR, "sandbox_error")
enum class ErrorKind {
#define X(name, desc) name,
  ENUM_ERROR_KIND_
#undef X
};

struct ResourceLimits {
  double timeout_seconds;
  long memory_mb;
  int cpu_cores;
  double cpu_seconds; // 0 = timeout_seconds * cpu_cores
};

struct LimitOverrides {
  std::optional<double> timeout_seconds;
  std::optional<long> memory_mb;
  std::optional<int> cpu_cores;
};

// process-wide defaults and hard maxima; see limits.cpp
extern ResourceLimits kDefaultLimits;
extern ResourceLimits kMaxLimits;

struct Violation {
  ViolationRule rule;
  int line;
  std::string message;
};

struct ValidationVerdict {
  bool accepted;
  std::vector<Violation> violations;

  ValidationVerdict() : accepted(false) {}
  bool IsSyntaxError() const {
    return violations.size() == 1 && violations[0].rule == ViolationRule::SYNTAX_ERROR;
  }
};

struct ArtifactDescriptor {
  std::string kind; // dataframe, json, text or bytes
  std::string name;
  std::string locator;
};

// ExecutionOutcome variants
struct Completed {
  std::string stdout_text;
  std::string return_summary;
  std::vector<ArtifactDescriptor> artifacts;
};
struct RuntimeFailure {
  std::string exception_summary;
  std::string stdout_text;
};
struct TimedOut {
  double elapsed; // seconds
  std::string stdout_text;
};
struct ResourceExceeded {
  ResourceKind kind;
};
struct Killed {
  int signal;
};
// the jail could not be set up; no user code ran
struct SandboxError {
  std::string message;
};
using ExecutionOutcome =
    std::variant<Completed, RuntimeFailure, TimedOut, ResourceExceeded, Killed, SandboxError>;

struct AgentResponse {
  struct Error {
    ErrorKind kind;
    std::string message;
    std::vector<Violation> violations;
  };
  bool ok;
  std::string summary;
  std::string output; // captured stdout
  std::string result; // summary of the trailing expression value
  std::vector<ArtifactDescriptor> artifacts;
  std::optional<Error> error;

  AgentResponse() : ok(false) {}
};

class CodeSubmission {
 public:
  // unique in a run; used for box directories and logging
  long submission_internal_id;
  // opaque id of the agent tool call, echoed back in the response
  std::string request_id;
  std::string source;
  std::map<std::string, std::string> context;
  LimitOverrides limits;

  struct Reporter {
    // these functions should not block
    std::function<void(const CodeSubmission&, SubmissionState)> ReportState;
    std::function<void(const CodeSubmission&, const AgentResponse&)> ReportFinalized;
  };
  Reporter reporter;

  CodeSubmission() : submission_internal_id(0) {}
};

// Synchronous pipeline: validate, build namespace, execute, assemble.
// Reports every state transition through sub.reporter.ReportState.
AgentResponse RunSubmission(const CodeSubmission&);

// Call from a dedicated thread; runs at most kMaxParallel submissions at once
void WorkLoop(bool loop = true);

// Blocks until the queue is empty and nothing is running
void WaitIdle();

size_t CurrentSubmissionQueueSize();

// Called from any thread
// 0 = no limit; return false only if queue size exceeded
bool PushSubmission(CodeSubmission&&, size_t max_queue = 0);

#endif  // INCLUDE_CODEBOX_SUBMISSION_H_
