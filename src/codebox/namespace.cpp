#include <codebox/namespace.h>

#include <atomic>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "utils.h"

namespace {

std::atomic_long context_id_seq = 0;

} // namespace

std::unordered_set<std::string> ExecutionContext::BoundNames() const {
  std::unordered_set<std::string> ret;
  for (auto& i : bindings) ret.insert(i.name);
  return ret;
}

ExecutionContext BuildNamespace(const CodeSubmission& sub, const ValidationVerdict& verdict) {
  if (!verdict.accepted) {
    throw std::logic_error("namespace requested for a rejected submission");
  }
  ExecutionContext ctx;
  ctx.id = ++context_id_seq;
  ctx.bindings = Capabilities();
  for (auto& [key, value] : sub.context) {
    if (key == kInputLocatorKey) {
      ctx.input_locator = value;
    } else if (key == kOutputLocatorKey) {
      ctx.output_locator = value;
    } else {
      ctx.values.emplace(key, value);
    }
  }
  spdlog::debug("Namespace built: id={} context={} bindings={} values={}",
                sub.submission_internal_id, ctx.id, ctx.bindings.size(), ctx.values.size());
  return ctx;
}

std::string RenderManifest(const ExecutionContext& ctx) {
  nlohmann::json bindings = nlohmann::json::array();
  for (auto& i : ctx.bindings) {
    bindings.push_back({
      {"name", i.name},
      {"kind", CapabilityKindName(i.kind)},
      {"target", i.target},
      {"members", i.members},
      {"optional", i.optional},
    });
  }
  nlohmann::json manifest = {
    {"version", std::string(kCapabilityVersion)},
    {"id", ctx.id},
    {"bindings", bindings},
    {"context", ctx.values},
  };
  return manifest.dump();
}
