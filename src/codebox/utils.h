#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <codebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

// close every fd >= minfd
int CloseFrom(int minfd);

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

std::string Base64Encode(const std::string&);
// accepts both the standard and the URL-safe alphabet; stops at padding
std::string Base64Decode(const std::string&);

#endif  // UTILS_H_
