#include <codebox/executor.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/sysinfo.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <cstring>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "broker.h"
#include "outcome.h"
#include "prelude.h"
#include "sandbox_exec.h"

double kGraceSeconds = 2;
long kMaxOutputBytes = 100'000;
long kScratchKiB = 256 * 1024;

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kUidBase = 50000, kUidPoolSize = 100;
constexpr int kFileLimit = 64;
// numpy/OpenBLAS helper threads count against RLIMIT_NPROC
constexpr int kExtraThreads = 16;
constexpr size_t kReadChunk = 65536;
// after the helper reported, how long stray pipe writers may keep us waiting
constexpr auto kDrainTimeout = std::chrono::seconds(1);

std::mutex pool_mtx;
std::vector<int> uid_pool, cpuid_pool;
bool pool_init = false;
std::atomic_long executions_started = 0;
std::once_flag sigpipe_flag;

void InitPools() {
  for (int i = 0; i < kUidPoolSize; i++) uid_pool.push_back(i + kUidBase);
  for (int i = 0, N = get_nprocs(); i < N; i++) {
    if (CPU_ISSET(i, &kPinnedCpus)) cpuid_pool.push_back(i);
  }
  pool_init = true;
}

// a uid and (if pinning is configured) cpu_cores CPUs, returned on destruction
class Lease {
 public:
  int uid;
  std::vector<int> cpus;

  explicit Lease(int cores) : uid(-1) {
    std::lock_guard lck(pool_mtx);
    if (!pool_init) InitPools();
    if (uid_pool.empty()) return;
    uid = uid_pool.back();
    uid_pool.pop_back();
    if ((int)cpuid_pool.size() < cores) {
      if (CPU_COUNT(&kPinnedCpus)) {
        spdlog::warn("No available cpu; task won\'t be pinned");
      }
    } else {
      cpus.assign(cpuid_pool.end() - cores, cpuid_pool.end());
      cpuid_pool.resize(cpuid_pool.size() - cores);
    }
  }
  ~Lease() {
    std::lock_guard lck(pool_mtx);
    if (uid != -1) uid_pool.push_back(uid);
    cpuid_pool.insert(cpuid_pool.end(), cpus.begin(), cpus.end());
  }
};

// box directory of one execution; unmounted and removed on destruction
class Box {
  long id_;
  bool mounted_;
 public:
  explicit Box(long id) : id_(id), mounted_(false) {}
  ~Box() {
    if (mounted_) Umount(BoxWorkdir(id_));
    RemoveAll(BoxPath(id_));
  }

  bool Prepare(const std::string& code, const std::string& manifest, int uid) {
    if (fs::exists(BoxPath(id_))) {
      spdlog::warn("Stale box {} removed", BoxPath(id_).c_str());
      if (!RemoveAll(BoxPath(id_))) return false;
    }
    if (!CreateDirs(BoxCodeDir(id_), kPerm755) ||
        !WriteFile(BoxPrelude(id_), kPreludeSource, kPerm644) ||
        !WriteFile(BoxManifest(id_), manifest, kPerm644) ||
        !WriteFile(BoxSubmission(id_), code, kPerm644) ||
        !CreateDirs(BoxWorkdir(id_))) {
      return false;
    }
    if (!MountTmpfs(BoxWorkdir(id_), kScratchKiB)) return false;
    mounted_ = true;
    if (chown(BoxWorkdir(id_).c_str(), uid, uid) < 0 ||
        chmod(BoxWorkdir(id_).c_str(), 0700) < 0) {
      spdlog::warn("Failed handing {} to uid {}: {}", BoxWorkdir(id_).c_str(), uid, strerror(errno));
      return false;
    }
    return true;
  }
};

// the pipes between host and jail; host ends are non-blocking
struct Channels {
  enum { STDIN, STDOUT, STDERR, REQUEST, REPLY, NUM };
  int fds[NUM][2];

  Channels() {
    for (auto& i : fds) i[0] = i[1] = -1;
  }
  ~Channels() {
    for (auto& i : fds) {
      for (int& fd : i) CloseFd(fd);
    }
  }
  static void CloseFd(int& fd) {
    if (fd != -1) close(fd);
    fd = -1;
  }
  bool Open() {
    for (auto& i : fds) {
      if (pipe2(i, O_CLOEXEC) < 0) goto err;
    }
    for (int* fd : {&fds[STDOUT][0], &fds[STDERR][0], &fds[REQUEST][0], &fds[REPLY][1]}) {
      if (fcntl(*fd, F_SETFL, O_NONBLOCK) < 0) goto err;
    }
    // stdin of the jailed program reads EOF
    CloseFd(fds[STDIN][1]);
    return true;
  err:
    spdlog::warn("Failed creating pipes: {}", strerror(errno));
    return false;
  }
  // once the helper has its copies
  void CloseJailEnds() {
    CloseFd(fds[STDIN][0]);
    CloseFd(fds[STDOUT][1]);
    CloseFd(fds[STDERR][1]);
    CloseFd(fds[REQUEST][1]);
    CloseFd(fds[REPLY][0]);
  }
};

class Capture {
  std::string buf_;
  size_t total_;
 public:
  Capture() : total_(0) {}
  void Append(const char* data, size_t len) {
    total_ += len;
    size_t limit = kMaxOutputBytes;
    if (buf_.size() < limit) buf_.append(data, std::min(len, limit - buf_.size()));
  }
  bool Empty() const { return total_ == 0; }
  std::string Text() const {
    if (total_ <= buf_.size()) return buf_;
    return buf_ + "\n... [output truncated, " + std::to_string(total_) + " bytes total, limit " +
        std::to_string(kMaxOutputBytes) + "]";
  }
};

SandboxOptions MakeOptions(long id, const ResourceLimits& lim, const Lease& lease, const Channels& ch) {
  SandboxOptions opt;
  opt.boxdir = BoxPath(id);
  opt.command = {kPythonPath, "-I", "-B", "-u",
                 BoxPrelude(-1, true), BoxManifest(-1, true), BoxSubmission(-1, true)};
  std::string threads = std::to_string(lim.cpu_cores);
  opt.envs = {
    "PATH=/usr/local/bin:/usr/bin:/bin",
    "HOME=" + BoxWorkdir(-1, true).string(),
    "TMPDIR=" + BoxWorkdir(-1, true).string(),
    "MPLCONFIGDIR=" + BoxWorkdir(-1, true).string(),
    "LANG=C.UTF-8",
    "OPENBLAS_NUM_THREADS=" + threads,
    "OMP_NUM_THREADS=" + threads,
    "MKL_NUM_THREADS=" + threads,
    "CODEBOX_CHANNEL=3,4",
  };
  opt.workdir = BoxWorkdir(-1, true);
  opt.fd_input = ch.fds[Channels::STDIN][0];
  opt.fd_output = ch.fds[Channels::STDOUT][1];
  opt.fd_error = ch.fds[Channels::STDERR][1];
  opt.fd_extra = {ch.fds[Channels::REQUEST][1], ch.fds[Channels::REPLY][0]};
  opt.cpu_set = lease.cpus;
  opt.uid = opt.gid = lease.uid;
  // both are backstops; the watchdog ends a run at the deadline
  opt.limits.wall_us = long((lim.timeout_seconds + kGraceSeconds + 1) * 1'000'000);
  opt.limits.cpu_us = long(lim.cpu_seconds * 1'000'000) + 50'000;
  opt.limits.rss_kib = lim.memory_mb * 1024;
  opt.limits.processes = lim.cpu_cores + kExtraThreads;
  opt.limits.files = kFileLimit;
  opt.limits.fsize_kib = kScratchKiB;
  opt.share_net = false;
  opt.dirs = {"/usr", "/lib", "/lib64", "/lib32", "/etc/alternatives", "/bin"};
  opt.FilterDirs();
  return opt;
}

double Seconds(Clock::duration d) {
  return std::chrono::duration<double>(d).count();
}

// Service the pipes until the helper reports or the watchdog gives up.
void Supervise(SandboxProcess& proc, Channels& ch, HelperBroker& broker,
               const ResourceLimits& lim, Clock::time_point start, RunRecord& rec) {
  int& out_fd = ch.fds[Channels::STDOUT][0];
  int& err_fd = ch.fds[Channels::STDERR][0];
  int& req_fd = ch.fds[Channels::REQUEST][0];
  int& rep_fd = ch.fds[Channels::REPLY][1];
  Capture out, err;
  std::string req_buf, reply_buf;
  char buf[kReadChunk];

  const auto deadline = start + std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(lim.timeout_seconds));
  const auto grace = std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(kGraceSeconds));
  bool term_sent = false, kill_sent = false, reported = false;
  Clock::time_point kill_at, give_up_at;

  auto CloseChannel = [&]() {
    Channels::CloseFd(req_fd);
    Channels::CloseFd(rep_fd);
    req_buf.clear();
    reply_buf.clear();
  };
  // read what is available; false on EOF or error
  auto Drain = [&](int fd, auto&& sink) {
    while (true) {
      ssize_t n = read(fd, buf, sizeof(buf));
      if (n > 0) {
        sink(buf, n);
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      return n < 0 && errno == EAGAIN;
    }
  };

  while (true) {
    auto now = Clock::now();
    if (!term_sent && now >= deadline) {
      spdlog::info("Deadline reached: pid={} elapsed={:.3f}s", proc.pid, Seconds(now - start));
      rec.deadline_hit = true;
      term_sent = true;
      SandboxSignal(proc, SIGTERM);
      kill_at = now + grace;
    }
    if (term_sent && !kill_sent && now >= kill_at) {
      spdlog::info("Grace period over, killing pid={}", proc.pid);
      kill_sent = true;
      SandboxSignal(proc, SIGKILL);
      give_up_at = now + kDrainTimeout;
    }
    if (kill_sent && now >= give_up_at) break;
    if (reported && now >= give_up_at) {
      spdlog::warn("Pipes of pid={} still open after the jail exited", proc.pid);
      SandboxSignal(proc, SIGKILL);
      break;
    }
    if (reported && out_fd == -1 && err_fd == -1 && req_fd == -1) break;

    std::vector<struct pollfd> pfds;
    auto Watch = [&](int fd, short events) {
      if (fd != -1) pfds.push_back({fd, events, 0});
    };
    Watch(out_fd, POLLIN);
    Watch(err_fd, POLLIN);
    Watch(req_fd, POLLIN);
    if (!reply_buf.empty()) Watch(rep_fd, POLLOUT);
    if (!reported) Watch(proc.result_fd, POLLIN);

    Clock::time_point next = term_sent ? (kill_sent ? give_up_at : kill_at) : deadline;
    if (reported) next = std::min(next, give_up_at);
    int wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(next - now).count() + 1;
    int ret = poll(pfds.data(), pfds.size(), std::max(wait_ms, 0));
    if (ret < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed: {}", strerror(errno));
      SandboxSignal(proc, SIGKILL);
      break;
    }
    for (auto& pfd : pfds) {
      if (!pfd.revents) continue;
      if (pfd.fd == out_fd) {
        if (!Drain(out_fd, [&](const char* d, size_t n) { out.Append(d, n); })) Channels::CloseFd(out_fd);
      } else if (pfd.fd == err_fd) {
        if (!Drain(err_fd, [&](const char* d, size_t n) { err.Append(d, n); })) Channels::CloseFd(err_fd);
      } else if (pfd.fd == req_fd) {
        bool open = Drain(req_fd, [&](const char* d, size_t n) { req_buf.append(d, n); });
        size_t pos;
        while (req_fd != -1 && (pos = req_buf.find('\n')) != std::string::npos) {
          std::string reply = broker.Handle(req_buf.substr(0, pos));
          req_buf.erase(0, pos + 1);
          if (!reply.empty() && rep_fd != -1) reply_buf += reply + '\n';
        }
        if (req_fd != -1 && (long)req_buf.size() > kMaxRequestBytes) {
          spdlog::warn("Helper request over {} bytes, closing the channel of pid={}", kMaxRequestBytes, proc.pid);
          CloseChannel();
        } else if (!open) {
          Channels::CloseFd(req_fd);
        }
      } else if (pfd.fd == rep_fd) {
        ssize_t n = write(rep_fd, reply_buf.data(), reply_buf.size());
        if (n > 0) {
          reply_buf.erase(0, n);
        } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
          // EPIPE: the jail no longer listens
          Channels::CloseFd(rep_fd);
          reply_buf.clear();
        }
      } else if (pfd.fd == proc.result_fd) {
        reported = true;
        give_up_at = Clock::now() + kDrainTimeout;
      }
    }
  }
  rec.elapsed = Seconds(Clock::now() - start);
  rec.output = out.Text();
  if (!err.Empty()) rec.output += "\n[stderr]:\n" + err.Text();
}

void Interpret(const struct cjail_result& res, const ResourceLimits& lim, RunRecord& rec) {
  rec.reported = true;
  if (res.timekill == -1) {
    rec.setup_error = std::string("cjail_exec failed: ") + strerror(res.oomkill);
    return;
  }
  rec.oom_killed = res.oomkill > 0;
  if (res.info.si_code == CLD_EXITED) {
    rec.exit_code = res.info.si_status;
  } else {
    rec.term_signal = res.info.si_status;
  }
  long cpu_used = (res.rus.ru_utime.tv_sec + res.rus.ru_stime.tv_sec) * 1'000'000L +
                  res.rus.ru_utime.tv_usec + res.rus.ru_stime.tv_usec;
  if (res.timekill) {
    if (cpu_used >= long(lim.cpu_seconds * 1'000'000)) {
      rec.cpu_exceeded = true;
    } else {
      rec.deadline_hit = true;
    }
  }
  if (rec.term_signal == SIGXCPU) rec.cpu_exceeded = true;
  spdlog::debug("cjail result: code={} status={} timekill={} oomkill={} cpu_us={} max_rss_kib={}",
                res.info.si_code, res.info.si_status, res.timekill, res.oomkill,
                cpu_used, res.rus.ru_maxrss);
}

RunRecord Run(const std::string& code, const ExecutionContext& ctx, const ResourceLimits& lim) {
  RunRecord rec;
  Lease lease(lim.cpu_cores);
  if (lease.uid == -1) {
    rec.setup_error = "no free sandbox uid";
    return rec;
  }
  Box box(ctx.id);
  if (!box.Prepare(code, RenderManifest(ctx), lease.uid)) {
    rec.setup_error = "failed to prepare the sandbox directory";
    return rec;
  }
  Channels ch;
  if (!ch.Open()) {
    rec.setup_error = "failed to create the sandbox pipes";
    return rec;
  }
  SandboxOptions opt = MakeOptions(ctx.id, lim, lease, ch);
  SandboxProcess proc;
  auto start = Clock::now();
  if (!SandboxSpawn(opt, proc)) {
    rec.setup_error = "failed to start sandbox-exec";
    return rec;
  }
  executions_started++;
  ch.CloseJailEnds();
  spdlog::info("Execution started: context={} pid={} uid={} cpus={} timeout={}s memory={}MB cores={}",
               ctx.id, proc.pid, lease.uid, lease.cpus.size(),
               lim.timeout_seconds, lim.memory_mb, lim.cpu_cores);

  ArtifactStore store;
  // a request still waiting on the store at the deadline fails instead of stalling the watchdog
  store.SetDeadline(start + std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(lim.timeout_seconds)));
  HelperBroker broker(store, ctx);
  Supervise(proc, ch, broker, lim, start, rec);
  struct cjail_result res;
  if (SandboxCollect(proc, res)) {
    Interpret(res, lim, rec);
  } else if (rec.deadline_hit) {
    rec.reported = true;
    rec.term_signal = SIGKILL;
  }
  rec.finish = broker.Finish();
  rec.artifacts = broker.Artifacts();
  spdlog::info("Execution finished: context={} elapsed={:.3f}s deadline={} oom={} cpu={} "
               "exit={} signal={} helper_requests={}",
               ctx.id, rec.elapsed, rec.deadline_hit, rec.oom_killed, rec.cpu_exceeded,
               rec.exit_code, rec.term_signal, broker.Requests());
  return rec;
}

} // namespace

ExecutionOutcome Execute(const std::string& code, const ExecutionContext& ctx, const ResourceLimits& limits) {
  std::call_once(sigpipe_flag, []() { signal(SIGPIPE, SIG_IGN); });
  return ClassifyOutcome(Run(code, ctx, ClampLimits(limits)));
}

long ExecutionsStarted() {
  return executions_started;
}
