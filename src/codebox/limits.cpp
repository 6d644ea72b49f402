#include <codebox/executor.h>

#include <algorithm>

#include <spdlog/spdlog.h>

ResourceLimits kDefaultLimits = {30, 1024, 1, 0};
ResourceLimits kMaxLimits = {120, 4096, 4, 0};

namespace {

constexpr double kMinTimeout = 1;
constexpr long kMinMemoryMB = 64;

inline double CpuSeconds(const ResourceLimits& lim) {
  return lim.cpu_seconds > 0 ? lim.cpu_seconds : lim.timeout_seconds * lim.cpu_cores;
}

} // namespace

ResourceLimits ClampLimits(const ResourceLimits& lim) {
  ResourceLimits ret;
  ret.timeout_seconds = std::clamp(lim.timeout_seconds, kMinTimeout,
                                   std::max(kMinTimeout, kMaxLimits.timeout_seconds));
  ret.memory_mb = std::clamp(lim.memory_mb, kMinMemoryMB, std::max(kMinMemoryMB, kMaxLimits.memory_mb));
  ret.cpu_cores = std::clamp(lim.cpu_cores, 1, std::max(1, kMaxLimits.cpu_cores));
  ret.cpu_seconds = lim.cpu_seconds > 0 ? std::min(lim.cpu_seconds, CpuSeconds(kMaxLimits))
                                        : ret.timeout_seconds * ret.cpu_cores;
  return ret;
}

ResourceLimits ResolveLimits(const LimitOverrides& over) {
  ResourceLimits lim = kDefaultLimits;
  if (over.timeout_seconds) lim.timeout_seconds = *over.timeout_seconds;
  if (over.memory_mb) lim.memory_mb = *over.memory_mb;
  if (over.cpu_cores) lim.cpu_cores = *over.cpu_cores;
  ResourceLimits ret = ClampLimits(lim);
  spdlog::debug("Limits resolved: timeout={}s memory={}MB cores={} cpu={}s",
                ret.timeout_seconds, ret.memory_mb, ret.cpu_cores, ret.cpu_seconds);
  return ret;
}
