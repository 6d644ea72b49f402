#include "paths.h"

fs::path kBoxRoot = "/tmp/codebox";
fs::path kPythonPath = "/usr/bin/python3";

namespace internal {
fs::path kDataDir = fs::path(CODEBOX_DATA_DIR);
} // internal

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(long id, bool inside_box) {
  return inside_box ? fs::path("/") : BoxPath(id);
}

} // namespace

fs::path BoxPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}
fs::path BoxCodeDir(long id, bool inside_box) {
  return BoxRoot(id, inside_box) / "code";
}
fs::path BoxPrelude(long id, bool inside_box) {
  return BoxCodeDir(id, inside_box) / "prelude.py";
}
fs::path BoxManifest(long id, bool inside_box) {
  return BoxCodeDir(id, inside_box) / "manifest.json";
}
fs::path BoxSubmission(long id, bool inside_box) {
  return BoxCodeDir(id, inside_box) / "submission.py";
}
fs::path BoxWorkdir(long id, bool inside_box) {
  return BoxRoot(id, inside_box) / "workdir";
}

fs::path SandboxExecPath() {
  return kDataDir / "sandbox-exec";
}
fs::path LockFilePath() {
  return kDataDir / "lock";
}
