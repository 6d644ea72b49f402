#include <codebox/result.h>

#include <cstdio>
#include <cstring>

#include <nlohmann/json.hpp>
#include "utils.h"

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

AgentResponse Failure(ErrorKind kind, std::string message, std::string output = "") {
  AgentResponse ret;
  ret.ok = false;
  ret.output = std::move(output);
  ret.summary = message;
  ret.error = AgentResponse::Error{kind, std::move(message), {}};
  return ret;
}

std::string FormatSeconds(double sec) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f", sec);
  return buf;
}

} // namespace

AgentResponse Assemble(const ExecutionOutcome& outcome) {
  return std::visit(Overloaded{
    [](const Completed& res) {
      AgentResponse ret;
      ret.ok = true;
      ret.output = res.stdout_text;
      ret.result = res.return_summary;
      ret.artifacts = res.artifacts;
      ret.summary = "Execution completed";
      if (size_t n = res.artifacts.size(); n) {
        ret.summary += " with " + std::to_string(n) + (n == 1 ? " artifact" : " artifacts");
      }
      return ret;
    },
    [](const RuntimeFailure& res) {
      return Failure(ErrorKind::RUNTIME_FAILURE, res.exception_summary, res.stdout_text);
    },
    [](const TimedOut& res) {
      return Failure(ErrorKind::TIMED_OUT,
                     "Execution cancelled after " + FormatSeconds(res.elapsed) + "s: time limit exceeded",
                     res.stdout_text);
    },
    [](const ResourceExceeded& res) {
      std::string what = res.kind == ResourceKind::MEMORY ? "Memory limit exceeded" : "CPU time limit exceeded";
      return Failure(ErrorKind::RESOURCE_EXCEEDED, what);
    },
    [](const Killed& res) {
      return Failure(ErrorKind::KILLED_EXTERNALLY,
                     "Execution killed by signal " + std::to_string(res.signal) +
                     " (" + strsignal(res.signal) + ")");
    },
    [](const SandboxError& res) {
      return Failure(ErrorKind::SANDBOX_ERROR, "Sandbox error: " + res.message);
    },
  }, outcome);
}

AgentResponse Assemble(const ValidationVerdict& verdict) {
  if (verdict.accepted) {
    // not an error; nothing ran yet
    AgentResponse ret;
    ret.ok = true;
    ret.summary = "Validation passed";
    return ret;
  }
  if (verdict.IsSyntaxError()) {
    auto& v = verdict.violations[0];
    AgentResponse ret = Failure(ErrorKind::SYNTAX_INVALID,
        "Syntax error (line " + std::to_string(v.line) + "): " + v.message);
    ret.error->violations = verdict.violations;
    return ret;
  }
  std::string message = "Code rejected: " + std::to_string(verdict.violations.size()) +
      (verdict.violations.size() == 1 ? " violation" : " violations");
  for (auto& v : verdict.violations) {
    message += "\n  line " + std::to_string(v.line) + " [" + ViolationRuleName(v.rule) + "] " + v.message;
  }
  AgentResponse ret = Failure(ErrorKind::VALIDATION_REJECTED, message);
  ret.summary = "Code rejected by validation";
  ret.error->violations = verdict.violations;
  return ret;
}

std::string ResponseToJson(const AgentResponse& resp, const std::string& request_id) {
  nlohmann::json artifacts = nlohmann::json::array();
  for (auto& i : resp.artifacts) {
    artifacts.push_back({{"kind", i.kind}, {"name", i.name}, {"locator", i.locator}});
  }
  nlohmann::json ret = {
    {"ok", resp.ok},
    {"summary", resp.summary},
    {"output", resp.output},
    {"result", resp.result},
    {"artifacts", artifacts},
  };
  if (!request_id.empty()) ret["id"] = request_id;
  if (resp.error) {
    nlohmann::json error = {
      {"kind", ErrorKindName(resp.error->kind)},
      {"message", resp.error->message},
    };
    if (!resp.error->violations.empty()) {
      nlohmann::json violations = nlohmann::json::array();
      for (auto& v : resp.error->violations) {
        violations.push_back({{"rule", ViolationRuleName(v.rule)}, {"line", v.line}, {"message", v.message}});
      }
      error["violations"] = violations;
    }
    ret["error"] = error;
  }
  return ret.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
