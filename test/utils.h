#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <mutex>
#include <chrono>
#include <condition_variable>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <httplib.h>
#include <codebox/submission.h>

// rule names of a verdict, in order
std::vector<std::string> RuleNames(const ValidationVerdict&);
bool HasViolation(const ValidationVerdict&, ViolationRule, int line = -1);

// Runs WorkLoop on a detached thread, once per process
void StartWorkLoop();

// Root, cgroups, python3 and sandbox-exec are all needed to run anything.
// Probes with a trivial execution; the result is cached.
bool JailAvailable();
bool PythonHasModule(const std::string& module);

// In-process artifact store:
//   GET  /artifacts/<locator>/<path>              -> files[locator/path] or 404
//   POST /artifacts/<locator>/<path>?upload=true  -> uploads[locator/path], replies {"locator": "store://..."}
// Paths with ".." or an empty segment are answered with 400.
class FakeArtifactStore {
  httplib::Server svr_;
  std::thread thread_;
  int port_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool stopping_;
  std::chrono::milliseconds delay_;
  std::map<std::string, std::string> files_, uploads_;
  std::vector<std::string> authorizations_;

  // holds a request for the configured delay; returns early on shutdown
  void Stall(std::unique_lock<std::mutex>& lck);
 public:
  FakeArtifactStore();
  ~FakeArtifactStore();

  std::string Url() const { return "http://127.0.0.1:" + std::to_string(port_); }
  void AddFile(const std::string& key, const std::string& content);
  // every answer is held back this long
  void SetDelay(std::chrono::milliseconds delay);
  std::map<std::string, std::string> Uploads() const;
  std::vector<std::string> Authorizations() const;
};

#endif // TEST_UTILS_H_
