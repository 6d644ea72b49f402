#include "http_utils.h"

#include <algorithm>

#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  if (str.size() > 64) return "(" + std::to_string(str.size()) + " bytes)";
  return str;
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  // never log credentials
  std::vector<std::string> names;
  for (auto& i : headers) names.push_back(i.first);
  return fmt::format("headers={}", names);
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}

void FitTimeouts(httplib::Client& cli, Deadline deadline, time_t connect_sec, time_t transfer_sec) {
  using namespace std::chrono;
  auto left = duration_cast<microseconds>(deadline - steady_clock::now());
  left = std::max(left, microseconds(1000));
  auto Fit = [&](time_t sec) {
    microseconds ret = std::min<microseconds>(seconds(sec), left);
    return std::make_pair((time_t)(ret.count() / 1'000'000), (time_t)(ret.count() % 1'000'000));
  };
  auto conn = Fit(connect_sec), xfer = Fit(transfer_sec);
  cli.set_connection_timeout(conn.first, conn.second);
  cli.set_read_timeout(xfer.first, xfer.second);
  cli.set_write_timeout(xfer.first, xfer.second);
}
