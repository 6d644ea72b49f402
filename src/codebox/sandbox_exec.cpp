#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

// parked here while being moved into place
constexpr int kHighFd = 256;

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t n = write(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, len -= n;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, len -= n;
  }
  return true;
}

} // namespace

bool SandboxSpawn(const SandboxOptions& orig, SandboxProcess& proc) {
  // fd layout of sandbox-exec: 0 options (JSON), 1 result, 2 inherited stderr,
  // then fd_extra, then stdin/stdout/stderr of the jailed program
  SandboxOptions opt = orig;
  std::vector<int> sources, targets;
  int next = 3;
  for (auto& i : opt.fd_extra) {
    sources.push_back(i);
    targets.push_back(i = next++);
  }
  for (int* fd : {&opt.fd_input, &opt.fd_output, &opt.fd_error}) {
    if (*fd == -1) continue;
    sources.push_back(*fd);
    targets.push_back(*fd = next++);
  }
  std::string doc = opt.ToJson();
  auto cmd = SandboxExecPath();
  // the child only fills it; nothing is allocated after fork()
  std::vector<int> parked(sources.size());

  int inpipe[2], outpipe[2];
  if (pipe2(inpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    goto err;
  }
  proc.pid = fork();
  if (proc.pid < 0) {
    close(inpipe[0]), close(inpipe[1]);
    close(outpipe[0]), close(outpipe[1]);
    goto err;
  }
  if (proc.pid == 0) {
    setpgid(0, 0);
    // F_DUPFD clears FD_CLOEXEC on the copy
    int high = kHighFd;
    for (size_t i = 0; i < sources.size(); i++) {
      int dup_fd = fcntl(sources[i], F_DUPFD, high);
      if (dup_fd < 0) _exit(1);
      parked[i] = high = dup_fd;
      high++;
    }
    int opt_fd = fcntl(outpipe[0], F_DUPFD, high++);
    int res_fd = fcntl(inpipe[1], F_DUPFD, high++);
    if (opt_fd < 0 || res_fd < 0) _exit(1);
    if (dup2(opt_fd, 0) < 0 || dup2(res_fd, 1) < 0) _exit(1);
    for (size_t i = 0; i < parked.size(); i++) {
      if (dup2(parked[i], targets[i]) < 0) _exit(1);
    }
    CloseFrom(next);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  // also set from the parent so that an early SandboxSignal cannot miss the group
  setpgid(proc.pid, proc.pid);
  close(inpipe[1]);
  close(outpipe[0]);
  spdlog::debug("sandbox-exec pid={} childpid={} boxdir={} command={}",
      getpid(), proc.pid, opt.boxdir, fmt::format("{}", opt.command));
  // the helper reads the options until EOF
  if (!WriteAll(outpipe[1], doc.data(), doc.size())) {
    int saved = errno;
    close(outpipe[1]);
    close(inpipe[0]);
    kill(proc.pid, SIGKILL);
    waitpid(proc.pid, nullptr, 0);
    proc.pid = -1;
    errno = saved;
    goto err;
  }
  close(outpipe[1]);
  proc.result_fd = inpipe[0];
  return true;
err:
  spdlog::warn("SandboxSpawn error: errno={} {}", errno, strerror(errno));
  return false;
}

bool SandboxCollect(SandboxProcess& proc, struct cjail_result& ret) {
  ret = {};
  bool ok = ReadAll(proc.result_fd, &ret, sizeof(ret));
  int status = 0;
  close(proc.result_fd);
  proc.result_fd = -1;
  while (waitpid(proc.pid, &status, 0) < 0 && errno == EINTR);
  if (!ok) {
    spdlog::info("sandbox-exec pid={} exited without a result, status={}", proc.pid, status);
    ret = {};
  } else if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  proc.pid = -1;
  return ok;
}

bool SandboxSignal(const SandboxProcess& proc, int sig) {
  if (proc.pid <= 0) return false;
  spdlog::debug("Signal {} to process group {}", sig, proc.pid);
  if (kill(-proc.pid, sig) < 0) {
    spdlog::warn("Failed signalling process group {}: {}", proc.pid, strerror(errno));
    return false;
  }
  return true;
}
