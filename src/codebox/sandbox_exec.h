#ifndef CODEBOX_SANDBOX_EXEC_H_
#define CODEBOX_SANDBOX_EXEC_H_

#include <sys/types.h>

#include "sandbox.h"

// We separate this from sandbox.h because these functions need logging and paths,
//   while sandbox.h is also linked into the small sandbox-exec helper

// before SandboxSpawn:
// 1. create the box (read-only code dir, tmpfs workdir owned by the jail uid)
// 2. take a unique uid&gid (and CPUs for cpuset if pinned)
// 3. create the pipes; every fd in the options must be O_CLOEXEC in this process
//    so that concurrent spawns never leak each other's pipes
struct SandboxProcess {
  pid_t pid;
  int result_fd; // becomes readable once the jail is gone

  SandboxProcess() : pid(-1), result_fd(-1) {}
};

// Fork and exec sandbox-exec in a new process group (pgid == pid). The fds in
// opt are renumbered for the helper: fd_extra to 3, 4, ... so that the jailed
// process sees them there. Returns false if nothing was started.
bool SandboxSpawn(const SandboxOptions& opt, SandboxProcess&);

// Read the cjail result and reap the helper. Returns false if the helper died
// before reporting. A cjail setup failure is reported as timekill = -1, oomkill = errno.
bool SandboxCollect(SandboxProcess&, struct cjail_result&);

// signal the whole process group of the helper, the jailed program included
bool SandboxSignal(const SandboxProcess&, int sig);

#endif  // CODEBOX_SANDBOX_EXEC_H_
