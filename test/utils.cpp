#include "utils.h"

#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <codebox/paths.h>
#include <codebox/utils.h>
#include <codebox/executor.h>
#include <codebox/namespace.h>
#include <codebox/validator.h>

std::vector<std::string> RuleNames(const ValidationVerdict& verdict) {
  std::vector<std::string> ret;
  for (auto& i : verdict.violations) ret.push_back(ViolationRuleName(i.rule));
  return ret;
}

bool HasViolation(const ValidationVerdict& verdict, ViolationRule rule, int line) {
  for (auto& i : verdict.violations) {
    if (i.rule == rule && (line < 0 || i.line == line)) return true;
  }
  return false;
}

void StartWorkLoop() {
  static std::once_flag flag;
  std::call_once(flag, []() {
    std::thread(WorkLoop, true).detach();
  });
}

bool PythonHasModule(const std::string& module) {
  std::string cmd = kPythonPath.string() + " -c 'import " + module + "' >/dev/null 2>&1";
  return std::system(cmd.c_str()) == 0;
}

bool JailAvailable() {
  static const bool available = []() {
    if (geteuid() != 0) return false;
    if (!fs::exists(kPythonPath)) return false;
    if (!fs::exists(internal::kDataDir / "sandbox-exec")) return false;
    CodeSubmission sub;
    sub.source = "1";
    ExecutionContext ctx = BuildNamespace(sub, Validate(sub.source));
    ExecutionOutcome outcome = Execute(sub.source, ctx, kDefaultLimits);
    return std::holds_alternative<Completed>(outcome);
  }();
  return available;
}

FakeArtifactStore::FakeArtifactStore() : stopping_(false), delay_(0) {
  auto bad_path = [](const std::string& path) {
    return path.find("..") != std::string::npos || path.find("//") != std::string::npos;
  };
  svr_.Get(R"(/artifacts/(.+))", [this, bad_path](const httplib::Request& req, httplib::Response& res) {
    std::string key = req.matches[1];
    std::unique_lock lck(mtx_);
    authorizations_.push_back(req.get_header_value("Authorization"));
    Stall(lck);
    if (bad_path(key)) {
      res.status = 400;
      res.set_content("invalid path", "text/plain");
      return;
    }
    auto it = files_.find(key);
    if (it == files_.end()) {
      res.status = 404;
      res.set_content("not found", "text/plain");
      return;
    }
    res.set_content(it->second, "application/octet-stream");
  });
  svr_.Post(R"(/artifacts/(.+))", [this, bad_path](const httplib::Request& req, httplib::Response& res) {
    std::string key = req.matches[1];
    std::unique_lock lck(mtx_);
    authorizations_.push_back(req.get_header_value("Authorization"));
    Stall(lck);
    if (bad_path(key) || !req.has_param("upload")) {
      res.status = 400;
      res.set_content("invalid path", "text/plain");
      return;
    }
    uploads_[key] = req.body;
    res.set_content(nlohmann::json{{"locator", "store://" + key}}.dump(), "application/json");
  });
  port_ = svr_.bind_to_any_port("127.0.0.1");
  thread_ = std::thread([this]() { svr_.listen_after_bind(); });
  while (!svr_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

FakeArtifactStore::~FakeArtifactStore() {
  {
    std::lock_guard lck(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  svr_.stop();
  thread_.join();
}

void FakeArtifactStore::Stall(std::unique_lock<std::mutex>& lck) {
  cv_.wait_for(lck, delay_, [this]() { return stopping_; });
}

void FakeArtifactStore::SetDelay(std::chrono::milliseconds delay) {
  std::lock_guard lck(mtx_);
  delay_ = delay;
}

void FakeArtifactStore::AddFile(const std::string& key, const std::string& content) {
  std::lock_guard lck(mtx_);
  files_[key] = content;
}

std::map<std::string, std::string> FakeArtifactStore::Uploads() const {
  std::lock_guard lck(mtx_);
  return uploads_;
}

std::vector<std::string> FakeArtifactStore::Authorizations() const {
  std::lock_guard lck(mtx_);
  return authorizations_;
}
