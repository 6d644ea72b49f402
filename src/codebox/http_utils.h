#ifndef CODEBOX_HTTP_UTILS_H_
#define CODEBOX_HTTP_UTILS_H_

/// Log HTTP requests

#include <chrono>
#include <thread>
#include <memory>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);

} // namespace http_utils

bool IsSuccess(const httplib::Result&);

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint, std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

using Deadline = std::chrono::steady_clock::time_point;

// the default timeouts, cut short so that the next request ends by the deadline
void FitTimeouts(httplib::Client&, Deadline, time_t connect_sec, time_t transfer_sec);

// 4xx answers and canceled requests are final; anything else is retried up to
// `retries` times while the deadline leaves room for another attempt
template <class Method, class... T>
httplib::Result RequestRetry(int retries, Deadline deadline, time_t connect_sec, time_t transfer_sec,
                             httplib::Client& cli, const std::string& endpoint, T&&... params) {
  using namespace std::chrono_literals;
  if (retries < 1) retries = 1;
  std::unique_ptr<httplib::Result> last_res;
  int attempts = 0;
  for (; attempts < retries; attempts++) {
    if (attempts) {
      if (deadline - std::chrono::steady_clock::now() <= 1s) break;
      std::this_thread::sleep_for(1s);
    }
    FitTimeouts(cli, deadline, connect_sec, transfer_sec);
    last_res = std::make_unique<httplib::Result>(HTTPRequest<Method>(cli, endpoint, params...));
    if (*last_res && http_utils::IsSuccess((*last_res)->status)) return std::move(*last_res);
    spdlog::debug("Error code={} status={}", (int)last_res->error(), *last_res ? (*last_res)->status : -1);
    if (!*last_res && last_res->error() == httplib::Error::Canceled) break;
    if (*last_res && (*last_res)->status >= 400 && (*last_res)->status < 500) break;
  }
  spdlog::warn("Request {} {} failed after {} attempts", Method::method_name, endpoint, attempts);
  return std::move(*last_res);
}

#endif  // CODEBOX_HTTP_UTILS_H_
