#include <csignal>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codebox/result.h>

using nlohmann::json;

TEST(Assemble, Completed) {
  AgentResponse resp = Assemble(Completed{"hi\n", "3", {}});
  EXPECT_TRUE(resp.ok);
  EXPECT_EQ(resp.summary, "Execution completed");
  EXPECT_EQ(resp.output, "hi\n");
  EXPECT_EQ(resp.result, "3");
  EXPECT_FALSE(resp.error);
}

TEST(Assemble, CompletedWithArtifacts) {
  std::vector<ArtifactDescriptor> artifacts = {
    {"dataframe", "top.csv", "store://a"},
    {"json", "stats.json", "store://b"},
  };
  AgentResponse resp = Assemble(Completed{"", "", artifacts});
  EXPECT_TRUE(resp.ok);
  EXPECT_EQ(resp.summary, "Execution completed with 2 artifacts");
  ASSERT_EQ(resp.artifacts.size(), 2u);
  EXPECT_EQ(resp.artifacts[1].name, "stats.json");

  resp = Assemble(Completed{"", "", {artifacts[0]}});
  EXPECT_EQ(resp.summary, "Execution completed with 1 artifact");
}

TEST(Assemble, RuntimeFailureKeepsOutput) {
  AgentResponse resp = Assemble(RuntimeFailure{"ValueError: boom (line 2)", "partial\n"});
  EXPECT_FALSE(resp.ok);
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::RUNTIME_FAILURE);
  EXPECT_EQ(resp.error->message, "ValueError: boom (line 2)");
  EXPECT_EQ(resp.summary, "ValueError: boom (line 2)");
  EXPECT_EQ(resp.output, "partial\n");
}

TEST(Assemble, TimedOut) {
  AgentResponse resp = Assemble(TimedOut{30.04, "tick\n"});
  EXPECT_FALSE(resp.ok);
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::TIMED_OUT);
  EXPECT_EQ(resp.error->message, "Execution cancelled after 30.0s: time limit exceeded");
  EXPECT_EQ(resp.output, "tick\n");
}

TEST(Assemble, ResourceExceeded) {
  AgentResponse resp = Assemble(ResourceExceeded{ResourceKind::MEMORY});
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::RESOURCE_EXCEEDED);
  EXPECT_EQ(resp.error->message, "Memory limit exceeded");
  resp = Assemble(ResourceExceeded{ResourceKind::CPU});
  EXPECT_EQ(resp.error->message, "CPU time limit exceeded");
}

TEST(Assemble, Killed) {
  AgentResponse resp = Assemble(Killed{SIGKILL});
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::KILLED_EXTERNALLY);
  EXPECT_EQ(resp.error->message.rfind("Execution killed by signal 9 (", 0), 0u);
}

TEST(Assemble, SandboxError) {
  AgentResponse resp = Assemble(SandboxError{"cgroup unavailable"});
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::SANDBOX_ERROR);
  EXPECT_EQ(resp.error->message, "Sandbox error: cgroup unavailable");
}

TEST(Assemble, VerdictAccepted) {
  ValidationVerdict verdict;
  verdict.accepted = true;
  AgentResponse resp = Assemble(verdict);
  EXPECT_TRUE(resp.ok);
  EXPECT_EQ(resp.summary, "Validation passed");
  EXPECT_FALSE(resp.error);
}

TEST(Assemble, VerdictSyntaxError) {
  ValidationVerdict verdict;
  verdict.violations.push_back({ViolationRule::SYNTAX_ERROR, 4, "unexpected indent"});
  AgentResponse resp = Assemble(verdict);
  EXPECT_FALSE(resp.ok);
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::SYNTAX_INVALID);
  EXPECT_EQ(resp.error->message, "Syntax error (line 4): unexpected indent");
  EXPECT_EQ(resp.error->violations.size(), 1u);
}

TEST(Assemble, VerdictRejected) {
  ValidationVerdict verdict;
  verdict.violations.push_back({ViolationRule::IMPORT, 1, "import of os is not allowed"});
  verdict.violations.push_back({ViolationRule::DYNAMIC_EVAL, 3, "eval is not allowed"});
  AgentResponse resp = Assemble(verdict);
  EXPECT_FALSE(resp.ok);
  ASSERT_TRUE(resp.error);
  EXPECT_EQ(resp.error->kind, ErrorKind::VALIDATION_REJECTED);
  EXPECT_EQ(resp.summary, "Code rejected by validation");
  EXPECT_EQ(resp.error->message,
            "Code rejected: 2 violations\n"
            "  line 1 [import] import of os is not allowed\n"
            "  line 3 [dynamic-eval] eval is not allowed");
  EXPECT_EQ(resp.error->violations.size(), 2u);
}

TEST(ResponseJson, Success) {
  AgentResponse resp = Assemble(Completed{"hi\n", "3", {{"text", "notes.txt", "store://n"}}});
  json j = json::parse(ResponseToJson(resp, "call-1"));
  EXPECT_EQ(j["id"], "call-1");
  EXPECT_EQ(j["ok"], true);
  EXPECT_EQ(j["output"], "hi\n");
  EXPECT_EQ(j["result"], "3");
  ASSERT_EQ(j["artifacts"].size(), 1u);
  EXPECT_EQ(j["artifacts"][0]["kind"], "text");
  EXPECT_EQ(j["artifacts"][0]["locator"], "store://n");
  EXPECT_FALSE(j.contains("error"));
}

TEST(ResponseJson, NoIdWhenAbsent) {
  json j = json::parse(ResponseToJson(Assemble(Killed{SIGKILL})));
  EXPECT_FALSE(j.contains("id"));
  EXPECT_EQ(j["error"]["kind"], "killed_externally");
  EXPECT_FALSE(j["error"].contains("violations"));
}

TEST(ResponseJson, Violations) {
  ValidationVerdict verdict;
  verdict.violations.push_back({ViolationRule::UNKNOWN_NAME, 2, "name foo is not available"});
  json j = json::parse(ResponseToJson(Assemble(verdict), "x"));
  EXPECT_EQ(j["ok"], false);
  EXPECT_EQ(j["error"]["kind"], "validation_rejected");
  ASSERT_EQ(j["error"]["violations"].size(), 1u);
  EXPECT_EQ(j["error"]["violations"][0]["rule"], "unknown-name");
  EXPECT_EQ(j["error"]["violations"][0]["line"], 2);
}

TEST(ResponseJson, InvalidUtf8Replaced) {
  AgentResponse resp = Assemble(Completed{"ok \xff\xfe end", "", {}});
  std::string line = ResponseToJson(resp);
  EXPECT_EQ(line.find('\n'), std::string::npos);
  json j = json::parse(line);
  std::string output = j["output"];
  EXPECT_EQ(output, "ok \xEF\xBF\xBD\xEF\xBF\xBD end");
}
