#ifndef CODEBOX_SANDBOX_H_
#define CODEBOX_SANDBOX_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>

// Everything sandbox-exec needs to set up one jail.
// Built by the executor, sent to the helper as a JSON document on its stdin.
struct SandboxOptions {
  struct Limits {
    long wall_us, cpu_us; // 0 = unlimited
    long rss_kib, vss_kib;
    int processes, files;
    long fsize_kib;

    Limits() : wall_us(0), cpu_us(0), rss_kib(0), vss_kib(0), processes(0), files(0), fsize_kib(0) {}
  };

  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside the box (relative to boxdir but starting with /)
  std::string workdir;
  int fd_input, fd_output, fd_error; // -1: keep the helper's own
  // inherited by the jailed process as fd 3, 4, ...
  std::vector<int> fd_extra;
  std::vector<int> cpu_set; // empty: not pinned
  int uid, gid;
  Limits limits;
  bool share_net;
  // read-only bind mounts of host directories at the same path
  std::vector<std::string> dirs;

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1), uid(65534), gid(65534), share_net(false) {}

  // drop the bind mounts that do not exist on this host
  void FilterDirs();
  std::string ToJson() const;
  // throws nlohmann::json::exception on a malformed document
  static SandboxOptions FromJson(const std::string&);
};

// cjail_ctx and the storage its pointers refer to
class JailContext {
  SandboxOptions opt_;
  std::vector<char*> argv_, envp_;
  std::vector<struct jail_mount_ctx> mounts_;
  struct jail_mount_list* mount_list_;
  cpu_set_t cpu_set_;
  struct cjail_ctx ctx_;
 public:
  explicit JailContext(const SandboxOptions&);
  JailContext(const JailContext&) = delete;
  JailContext& operator=(const JailContext&) = delete;
  ~JailContext();

  struct cjail_ctx* Get() { return &ctx_; }
};

#endif  // CODEBOX_SANDBOX_H_
