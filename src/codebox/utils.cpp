#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <dirent.h>
#include <sys/mount.h>
#include <atomic>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long submission_internal_id_seq = 0;

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int Base64CharToValue(const unsigned char chr) {
  if      (chr >= 'A' && chr <= 'Z') return chr - 'A';
  else if (chr >= 'a' && chr <= 'z') return chr - 'a' + ('Z' - 'A')               + 1;
  else if (chr >= '0' && chr <= '9') return chr - '0' + ('Z' - 'A') + ('z' - 'a') + 2;
  else if (chr == '+' || chr == '-') return 62;
  else if (chr == '/' || chr == '_') return 63;
  return -1;
}

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueSubmissionInternalId() {
  return ++submission_internal_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(ViolationRule, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ViolationRuleName, ViolationRule, ENUM_VIOLATION_RULE_)
#undef X

#define X(...) X_RETURN_ARG2(ResourceKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResourceKindName, ResourceKind, ENUM_RESOURCE_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindName, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(CapabilityKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CapabilityKindName, CapabilityKind, ENUM_CAPABILITY_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(SubmissionState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SubmissionStateName, SubmissionState, ENUM_SUBMISSION_STATE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout.write(content.data(), content.size())) {
      ec = std::error_code(errno ? errno : EIO, std::generic_category());
      goto err;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

std::string Base64Encode(const std::string& str) {
  std::string ret;
  ret.reserve((str.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 3 <= str.size(); i += 3) {
    unsigned v = (unsigned char)str[i] << 16 | (unsigned char)str[i+1] << 8 | (unsigned char)str[i+2];
    ret += kBase64Chars[v >> 18 & 63];
    ret += kBase64Chars[v >> 12 & 63];
    ret += kBase64Chars[v >> 6 & 63];
    ret += kBase64Chars[v & 63];
  }
  if (size_t rem = str.size() - i; rem) {
    unsigned v = (unsigned char)str[i] << 16;
    if (rem == 2) v |= (unsigned char)str[i+1] << 8;
    ret += kBase64Chars[v >> 18 & 63];
    ret += kBase64Chars[v >> 12 & 63];
    ret += rem == 2 ? kBase64Chars[v >> 6 & 63] : '=';
    ret += '=';
  }
  return ret;
}

std::string Base64Decode(const std::string& str) {
  std::string ret;
  ret.reserve(str.size() / 4 * 3);
  unsigned buf = 0;
  int bits = 0;
  for (unsigned char chr : str) {
    if (chr == '=') break;
    int v = Base64CharToValue(chr);
    if (v < 0) continue; // whitespace, line breaks
    buf = buf << 6 | v;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      ret += static_cast<char>(buf >> bits & 0xff);
    }
  }
  return ret;
}
