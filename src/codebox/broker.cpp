#include "broker.h"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "utils.h"

long kMaxArtifacts = 20;
long kMaxRequestBytes = 64L * 1024 * 1024;

namespace {

std::string Failure(const std::string& error) {
  return nlohmann::json{{"ok", false}, {"error", error}}.dump();
}

bool ValidKind(const std::string& kind) {
  return kind == "dataframe" || kind == "json" || kind == "text" || kind == "bytes";
}

} // namespace

std::string HelperBroker::HandleFetch(const std::string& path) {
  if (ctx_.input_locator.empty()) return Failure("no input locator in context");
  std::string content, error;
  if (!store_.Fetch(ctx_.input_locator, path, content, error)) {
    spdlog::info("Fetch failed: context={} path={} error={}", ctx_.id, path, error);
    return Failure(error);
  }
  spdlog::debug("Fetched {}: {} bytes", path, content.size());
  return nlohmann::json{{"ok", true}, {"content", Base64Encode(content)}}.dump();
}

std::string HelperBroker::HandleUpload(const std::string& path, const std::string& kind,
                                       const std::string& content_type, const std::string& content) {
  if (ctx_.output_locator.empty()) return Failure("no output locator in context");
  if (!ValidKind(kind)) return Failure("unknown artifact kind " + kind);
  if ((long)artifacts_.size() >= kMaxArtifacts) {
    return Failure("artifact limit of " + std::to_string(kMaxArtifacts) + " reached");
  }
  std::string locator, error;
  if (!store_.Upload(ctx_.output_locator, path, content_type, Base64Decode(content), locator, error)) {
    return Failure(error);
  }
  spdlog::info("Artifact uploaded: context={} kind={} name={} locator={}", ctx_.id, kind, path, locator);
  artifacts_.push_back({kind, path, locator});
  return nlohmann::json{{"ok", true}, {"locator", locator}}.dump();
}

std::string HelperBroker::Handle(const std::string& line) {
  requests_++;
  try {
    auto req = nlohmann::json::parse(line);
    if (!req.is_object()) return Failure("malformed request");
    std::string op = req.value("op", "");
    if (op == "fetch") {
      return HandleFetch(req.at("path").get<std::string>());
    } else if (op == "upload") {
      return HandleUpload(req.at("path").get<std::string>(), req.at("kind").get<std::string>(),
                          req.value("content_type", "application/octet-stream"),
                          req.at("content").get<std::string>());
    } else if (op == "finish") {
      FinishReport report;
      report.status = req.at("status").get<std::string>();
      report.summary = req.value("summary", "");
      report.type = req.value("type", "");
      report.message = req.value("message", "");
      if (auto it = req.find("line"); it != req.end() && it->is_number_integer()) {
        report.line = it->get<int>();
      }
      spdlog::debug("Finish reported: context={} status={}", ctx_.id, report.status);
      finish_ = std::move(report);
      return "";
    }
    return Failure("unknown operation " + op);
  } catch (nlohmann::json::exception& e) {
    spdlog::debug("Malformed helper request: {}", e.what());
    return Failure("malformed request");
  }
}
