#ifndef CODEBOX_PATHS_H_
#define CODEBOX_PATHS_H_

#include <codebox/paths.h>

using internal::kDataDir;

// Box layout of one execution (outside the jail / inside the jail):
//   kBoxRoot/000042/code     /code      prelude, manifest and submission; read-only for the jail
//   kBoxRoot/000042/workdir  /workdir   tmpfs scratch owned by the jail uid
// if inside_box = true, id is not used
fs::path BoxPath(long id);
fs::path BoxCodeDir(long id, bool inside_box = false);
fs::path BoxPrelude(long id, bool inside_box = false);
fs::path BoxManifest(long id, bool inside_box = false);
fs::path BoxSubmission(long id, bool inside_box = false);
fs::path BoxWorkdir(long id, bool inside_box = false);

fs::path SandboxExecPath();
fs::path LockFilePath();

#endif  // CODEBOX_PATHS_H_
