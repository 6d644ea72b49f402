#include "artifact_store.h"

#include <nlohmann/json.hpp>
#include "http_utils.h"

std::string kArtifactStoreUrl = "";
std::string kArtifactStoreToken = "";
int kArtifactRetries = 3;
long kMaxFetchBytes = 64L * 1024 * 1024;

namespace {

constexpr time_t kConnectTimeout = 5, kTransferTimeout = 60; // seconds

std::string StripSlashes(const std::string& str) {
  size_t l = str.find_first_not_of('/');
  if (l == std::string::npos) return "";
  return str.substr(l, str.find_last_not_of('/') - l + 1);
}

std::string DescribeFailure(const httplib::Result& res, const std::string& body) {
  if (!res) return "artifact store unreachable: " + httplib::to_string(res.error());
  std::string ret = "artifact store answered " + std::to_string(res->status);
  if (!body.empty() && body.size() < 200) ret += ": " + body;
  return ret;
}

const char kDeadlineError[] = "execution deadline reached";

} // namespace

ArtifactStore::ArtifactStore(const std::string& url, const std::string& token, int retries) :
    token_(token), retries_(retries), deadline_(Deadline::max()) {
  if (url.empty()) return;
  size_t scheme = url.find("://");
  size_t slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  host_ = url.substr(0, slash);
  if (slash != std::string::npos) {
    std::string base = StripSlashes(url.substr(slash));
    if (!base.empty()) base_path_ = "/" + base;
  }
}

// the path is passed as given; the store decides what it refuses
std::string ArtifactStore::Endpoint(const std::string& locator, const std::string& path) const {
  return base_path_ + "/artifacts/" + StripSlashes(locator) + "/" + path;
}

// socket timeouts are rounded to milliseconds and may fire a little early
bool ArtifactStore::PastDeadline() const {
  using namespace std::chrono_literals;
  return deadline_ - std::chrono::steady_clock::now() < 10ms;
}

bool ArtifactStore::Fetch(const std::string& locator, const std::string& path,
                          std::string& content, std::string& error) const {
  if (!Configured()) {
    error = "artifact store is not configured";
    return false;
  }
  if (PastDeadline()) {
    error = kDeadlineError;
    return false;
  }
  httplib::Client cli(host_);
  httplib::Headers headers;
  if (!token_.empty()) headers.emplace("Authorization", "Bearer " + token_);
  std::string body;
  bool too_large = false;
  // the body of every attempt, error answers included, arrives here
  auto res = RequestRetry<HTTPGet>(
      retries_, deadline_, kConnectTimeout, kTransferTimeout, cli, Endpoint(locator, path), headers,
      [&](const httplib::Response&) {
        body.clear();
        return true;
      },
      [&](const char* data, size_t len) {
        if ((long)(body.size() + len) > kMaxFetchBytes) {
          too_large = true;
          return false;
        }
        body.append(data, len);
        return true;
      });
  if (too_large) {
    spdlog::warn("Fetch of {} canceled: larger than {} bytes", path, kMaxFetchBytes);
    error = "artifact is larger than " + std::to_string(kMaxFetchBytes) + " bytes";
    return false;
  }
  if (!IsSuccess(res)) {
    error = PastDeadline() ? kDeadlineError : DescribeFailure(res, body);
    return false;
  }
  content = std::move(body);
  return true;
}

bool ArtifactStore::Upload(const std::string& locator, const std::string& path,
                           const std::string& content_type, const std::string& content,
                           std::string& stored_locator, std::string& error) const {
  if (!Configured()) {
    error = "artifact store is not configured";
    return false;
  }
  if (PastDeadline()) {
    error = kDeadlineError;
    return false;
  }
  httplib::Client cli(host_);
  FitTimeouts(cli, deadline_, kConnectTimeout, kTransferTimeout);
  httplib::Headers headers;
  if (!token_.empty()) headers.emplace("Authorization", "Bearer " + token_);
  auto res = HTTPRequest<HTTPPost>(cli, Endpoint(locator, path) + "?upload=true",
                                   headers, content, content_type);
  if (!IsSuccess(res)) {
    error = PastDeadline() ? kDeadlineError : DescribeFailure(res, res ? res->body : "");
    spdlog::warn("Upload of {} failed: {}", path, error);
    return false;
  }
  stored_locator = StripSlashes(locator) + "/" + path;
  try {
    auto body = nlohmann::json::parse(res->body);
    for (const char* key : {"locator", "url", "path"}) {
      if (body.contains(key) && body[key].is_string()) {
        stored_locator = body[key].get<std::string>();
        break;
      }
    }
  } catch (nlohmann::json::exception& e) {
    spdlog::debug("Upload reply of {} is not JSON: {}", path, e.what());
  }
  return true;
}
