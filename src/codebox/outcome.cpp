#include "outcome.h"

#include <csignal>

#include <spdlog/spdlog.h>

namespace {

constexpr size_t kMaxSummaryLen = 2000;

} // namespace

std::string FormatExceptionSummary(const std::string& type, const std::string& message, int line) {
  std::string ret = type.empty() ? "Exception" : type;
  if (!message.empty()) ret += ": " + message;
  std::string suffix = line > 0 ? " (line " + std::to_string(line) + ")" : "";
  if (ret.size() + suffix.size() > kMaxSummaryLen) {
    ret.resize(kMaxSummaryLen - suffix.size() - 3);
    ret += "...";
  }
  return ret + suffix;
}

ExecutionOutcome ClassifyOutcome(const RunRecord& rec) {
  if (!rec.setup_error.empty()) return SandboxError{rec.setup_error};
  if (rec.deadline_hit) return TimedOut{rec.elapsed, rec.output};
  if (rec.oom_killed) return ResourceExceeded{ResourceKind::MEMORY};
  if (rec.cpu_exceeded) return ResourceExceeded{ResourceKind::CPU};
  if (rec.finish) {
    const FinishReport& fin = *rec.finish;
    if (fin.status == "ok") return Completed{rec.output, fin.summary, rec.artifacts};
    if (fin.status == "error") {
      return RuntimeFailure{FormatExceptionSummary(fin.type, fin.message, fin.line), rec.output};
    }
    if (fin.status == "memory") return ResourceExceeded{ResourceKind::MEMORY};
    if (fin.status == "setup") return SandboxError{"namespace setup failed: " + fin.message};
    spdlog::warn("Unknown finish status {}", fin.status);
  }
  if (rec.term_signal) return Killed{rec.term_signal};
  // the prelude turns SIGTERM into this exit status
  if (rec.reported && rec.exit_code == 128 + SIGTERM) return Killed{SIGTERM};
  if (!rec.reported) return SandboxError{"sandbox helper exited without a result"};
  return RuntimeFailure{
      "interpreter exited with status " + std::to_string(rec.exit_code) + " without reporting a result",
      rec.output};
}
