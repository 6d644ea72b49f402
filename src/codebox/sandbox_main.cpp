#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <cstdio>
#include <string>

#include <nlohmann/json.hpp>
#include "sandbox.h"

namespace {

void IgnoreTerm(int) {}

bool ReadToEnd(int fd, std::string& out) {
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n < 0) return false;
    if (n == 0) return true;
    out.append(buf, n);
  }
}

struct cjail_result RunJail(const SandboxOptions& opt) {
  JailContext ctx(opt);
  struct cjail_result ret = {};
  if (cjail_exec(ctx.Get(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  // the host terminates a run by signalling our process group; the jailed
  // program takes the SIGTERM while we stay alive to report its result
  struct sigaction act = {};
  act.sa_handler = IgnoreTerm;
  act.sa_flags = SA_RESTART;
  sigaction(SIGTERM, &act, nullptr);

  std::string doc;
  if (!ReadToEnd(0, doc)) return 1;
  close(0);
  SandboxOptions opt;
  try {
    opt = SandboxOptions::FromJson(doc);
  } catch (const nlohmann::json::exception& e) {
    fprintf(stderr, "sandbox-exec: bad options: %s\n", e.what());
    return 1;
  }
  struct cjail_result res = RunJail(opt);
  if (write(1, &res, sizeof(res)) < 0) return 1;
}
