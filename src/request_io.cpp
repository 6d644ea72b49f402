#include "request_io.h"

#include <mutex>
#include <limits>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codebox/result.h>

size_t kMaxQueue = 20;

namespace {

std::mutex out_mtx;

void WriteLine(std::ostream& out, const std::string& line) {
  std::lock_guard lck(out_mtx);
  out << line << '\n' << std::flush;
}

std::string RequestId(const nlohmann::json& req) {
  if (!req.is_object() || !req.contains("id")) return "";
  auto& id = req["id"];
  return id.is_string() ? id.get<std::string>() : id.dump();
}

// out-of-range numbers saturate instead of wrapping; ClampLimits applies the real bounds
template <class T>
T GetSaturated(const nlohmann::json& j) {
  double v = j.get<double>();
  if (!(v > (double)std::numeric_limits<T>::min())) return std::numeric_limits<T>::min();
  if (!(v < (double)std::numeric_limits<T>::max())) return std::numeric_limits<T>::max();
  return static_cast<T>(v);
}

} // namespace

CodeSubmission ParseRequest(const std::string& line) {
  using nlohmann::json;
  json req = json::parse(line);
  CodeSubmission sub;
  sub.request_id = RequestId(req);
  sub.source = req.at("source").get<std::string>();
  if (auto it = req.find("context"); it != req.end() && !it->is_null()) {
    sub.context = it->get<std::map<std::string, std::string>>();
  }
  if (auto it = req.find("limits"); it != req.end() && !it->is_null()) {
    const json& lim = *it;
    if (lim.contains("timeoutSeconds")) sub.limits.timeout_seconds = lim["timeoutSeconds"].get<double>();
    if (lim.contains("memoryMB")) sub.limits.memory_mb = GetSaturated<long>(lim["memoryMB"]);
    if (lim.contains("cpuCores")) sub.limits.cpu_cores = GetSaturated<int>(lim["cpuCores"]);
  }
  return sub;
}

std::string ErrorResponse(const std::string& kind, const std::string& message,
                          const std::string& request_id) {
  nlohmann::json ret = {
    {"ok", false},
    {"summary", message},
    {"output", ""},
    {"result", ""},
    {"artifacts", nlohmann::json::array()},
    {"error", {{"kind", kind}, {"message", message}}},
  };
  if (!request_id.empty()) ret["id"] = request_id;
  return ret.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void ServeRequests(std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    CodeSubmission sub;
    try {
      sub = ParseRequest(line);
    } catch (const nlohmann::json::exception& err) {
      spdlog::warn("Malformed request: {}", err.what());
      // echo the id back if the line is at least valid JSON
      std::string id = RequestId(nlohmann::json::parse(line, nullptr, false));
      WriteLine(out, ErrorResponse("bad_request", std::string("malformed request: ") + err.what(), id));
      continue;
    }
    std::string id = sub.request_id;
    sub.reporter.ReportFinalized = [&out](const CodeSubmission& sub, const AgentResponse& resp) {
      WriteLine(out, ResponseToJson(resp, sub.request_id));
    };
    if (!PushSubmission(std::move(sub), kMaxQueue)) {
      spdlog::warn("Submission queue full ({}), request {} refused", kMaxQueue, id);
      WriteLine(out, ErrorResponse("busy", "too many pending executions", id));
    }
  }
  WaitIdle();
}

bool ServeOne(const std::string& request, std::ostream& out) {
  CodeSubmission sub;
  try {
    sub = ParseRequest(request);
  } catch (const nlohmann::json::exception& err) {
    spdlog::error("Malformed request: {}", err.what());
    WriteLine(out, ErrorResponse("bad_request", std::string("malformed request: ") + err.what()));
    return false;
  }
  AgentResponse resp = RunSubmission(sub);
  WriteLine(out, ResponseToJson(resp, sub.request_id));
  return resp.ok;
}
