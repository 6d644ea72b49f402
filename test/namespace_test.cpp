#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codebox/namespace.h>
#include <codebox/validator.h>

#include "codebox/prelude.h"

namespace {

ExecutionContext BuildAccepted(const std::map<std::string, std::string>& context = {}) {
  CodeSubmission sub;
  sub.source = "x = 1";
  sub.context = context;
  return BuildNamespace(sub, Validate(sub.source));
}

} // namespace

TEST(Namespace, LockStepWithAllowList) {
  ExecutionContext ctx = BuildAccepted();
  auto bound = ctx.BoundNames();
  auto& allowed = AllowedNames();
  for (auto& name : allowed) EXPECT_TRUE(bound.count(name)) << name << " allowed but not bound";
  for (auto& name : bound) EXPECT_TRUE(allowed.count(name)) << name << " bound but not allowed";
  EXPECT_EQ(bound.size(), ctx.bindings.size());
}

TEST(Namespace, EveryBindingPassesValidation) {
  for (auto& cap : Capabilities()) {
    ValidationVerdict verdict = Validate("value = " + cap.name + "\n");
    EXPECT_TRUE(verdict.accepted) << cap.name;
  }
}

TEST(Namespace, BlockedNamesAreNeverBound) {
  for (const char* name : {"eval", "exec", "compile", "open", "getattr", "__import__", "os", "sys",
                           "subprocess", "socket", "pickle", "input", "globals", "vars", "io"}) {
    EXPECT_EQ(FindCapability(name), nullptr) << name;
    EXPECT_FALSE(Validate(std::string("value = ") + name).accepted) << name;
  }
}

TEST(Namespace, LibraryMembersAreEnumerated) {
  const Capability* np = FindCapability("np");
  ASSERT_NE(np, nullptr);
  EXPECT_EQ(np->kind, CapabilityKind::LIBRARY);
  EXPECT_EQ(np->target, "numpy");
  auto has = [&](const std::string& member) {
    return std::find(np->members.begin(), np->members.end(), member) != np->members.end();
  };
  EXPECT_TRUE(has("linalg.norm"));
  EXPECT_FALSE(has("load"));
  EXPECT_FALSE(has("fromfile"));
  const Capability* stats = FindCapability("scipy_stats");
  ASSERT_NE(stats, nullptr);
  EXPECT_TRUE(stats->optional);
}

TEST(Namespace, RejectedVerdictThrows) {
  CodeSubmission sub;
  sub.source = "import os";
  EXPECT_THROW(BuildNamespace(sub, Validate(sub.source)), std::logic_error);
  EXPECT_THROW(BuildNamespace(sub, ValidationVerdict()), std::logic_error);
}

TEST(Namespace, FreshPerSubmission) {
  ExecutionContext a = BuildAccepted({{"k", "1"}}), b = BuildAccepted();
  EXPECT_NE(a.id, b.id);
  EXPECT_EQ(a.values.size(), 1u);
  EXPECT_TRUE(b.values.empty());
}

TEST(Namespace, LocatorsStayOnHost) {
  ExecutionContext ctx = BuildAccepted({
    {"input_locator", "runs/42/in"},
    {"output_locator", "runs/42/out"},
    {"question", "how many rows?"},
  });
  EXPECT_EQ(ctx.input_locator, "runs/42/in");
  EXPECT_EQ(ctx.output_locator, "runs/42/out");
  ASSERT_EQ(ctx.values.size(), 1u);
  EXPECT_EQ(ctx.values.at("question"), "how many rows?");

  auto manifest = nlohmann::json::parse(RenderManifest(ctx));
  EXPECT_EQ(manifest["version"], kCapabilityVersion);
  EXPECT_EQ(manifest["id"], ctx.id);
  EXPECT_EQ(manifest["context"].size(), 1u);
  EXPECT_EQ(manifest["context"]["question"], "how many rows?");
  EXPECT_EQ(manifest.dump().find("runs/42"), std::string::npos);
}

TEST(Namespace, ManifestBindings) {
  ExecutionContext ctx = BuildAccepted();
  auto manifest = nlohmann::json::parse(RenderManifest(ctx));
  ASSERT_EQ(manifest["bindings"].size(), Capabilities().size());
  bool found_np = false;
  for (auto& i : manifest["bindings"]) {
    if (i["name"] != "np") continue;
    found_np = true;
    EXPECT_EQ(i["kind"], "library");
    EXPECT_EQ(i["target"], "numpy");
    EXPECT_FALSE(i["optional"].get<bool>());
    EXPECT_GT(i["members"].size(), 10u);
  }
  EXPECT_TRUE(found_np);
}

TEST(Namespace, PreludeProvidesHelpers) {
  std::string prelude = kPreludeSource;
  for (auto& cap : Capabilities()) {
    if (cap.kind != CapabilityKind::HELPER) continue;
    EXPECT_NE(prelude.find(cap.name), std::string::npos) << cap.name;
  }
}
