#include "sandbox.h"

#include <sys/mount.h>
#include <algorithm>
#include <filesystem>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

char kBindType[] = "bind";

json LimitsToJson(const SandboxOptions::Limits& lim) {
  return {
    {"wall_us", lim.wall_us}, {"cpu_us", lim.cpu_us},
    {"rss_kib", lim.rss_kib}, {"vss_kib", lim.vss_kib},
    {"processes", lim.processes}, {"files", lim.files},
    {"fsize_kib", lim.fsize_kib},
  };
}

SandboxOptions::Limits LimitsFromJson(const json& j) {
  SandboxOptions::Limits lim;
  j.at("wall_us").get_to(lim.wall_us);
  j.at("cpu_us").get_to(lim.cpu_us);
  j.at("rss_kib").get_to(lim.rss_kib);
  j.at("vss_kib").get_to(lim.vss_kib);
  j.at("processes").get_to(lim.processes);
  j.at("files").get_to(lim.files);
  j.at("fsize_kib").get_to(lim.fsize_kib);
  return lim;
}

inline void SetTimeval(struct timeval& tv, long us) {
  tv.tv_sec = us / 1'000'000;
  tv.tv_usec = us % 1'000'000;
}

} // namespace

void SandboxOptions::FilterDirs() {
  std::error_code ec;
  dirs.erase(std::remove_if(dirs.begin(), dirs.end(), [&](const std::string& dir) {
    return !std::filesystem::is_directory(dir, ec);
  }), dirs.end());
}

std::string SandboxOptions::ToJson() const {
  return json{
    {"boxdir", boxdir},
    {"command", command},
    {"envs", envs},
    {"workdir", workdir},
    {"fd", {fd_input, fd_output, fd_error}},
    {"fd_extra", fd_extra},
    {"cpu_set", cpu_set},
    {"uid", uid},
    {"gid", gid},
    {"limits", LimitsToJson(limits)},
    {"share_net", share_net},
    {"dirs", dirs},
  }.dump();
}

SandboxOptions SandboxOptions::FromJson(const std::string& str) {
  json j = json::parse(str);
  SandboxOptions opt;
  j.at("boxdir").get_to(opt.boxdir);
  j.at("command").get_to(opt.command);
  j.at("envs").get_to(opt.envs);
  j.at("workdir").get_to(opt.workdir);
  const json& fds = j.at("fd");
  fds.at(0).get_to(opt.fd_input);
  fds.at(1).get_to(opt.fd_output);
  fds.at(2).get_to(opt.fd_error);
  j.at("fd_extra").get_to(opt.fd_extra);
  j.at("cpu_set").get_to(opt.cpu_set);
  j.at("uid").get_to(opt.uid);
  j.at("gid").get_to(opt.gid);
  opt.limits = LimitsFromJson(j.at("limits"));
  j.at("share_net").get_to(opt.share_net);
  j.at("dirs").get_to(opt.dirs);
  return opt;
}

JailContext::JailContext(const SandboxOptions& opt) : opt_(opt), mount_list_(mnt_list_new()) {
  cjail_ctx_init(&ctx_);
  // the broker channel lives above stderr
  ctx_.preservefd = !opt_.fd_extra.empty();
  ctx_.sharenet = opt_.share_net;
  if (opt_.fd_input != -1) ctx_.fd_input = opt_.fd_input;
  if (opt_.fd_output != -1) ctx_.fd_output = opt_.fd_output;
  if (opt_.fd_error != -1) ctx_.fd_error = opt_.fd_error;

  for (auto& i : opt_.command) argv_.push_back(i.data());
  argv_.push_back(nullptr);
  ctx_.argv = argv_.data();
  for (auto& i : opt_.envs) envp_.push_back(i.data());
  envp_.push_back(nullptr);
  ctx_.environ = envp_.data();
  ctx_.chroot = opt_.boxdir.data();
  ctx_.working_dir = opt_.workdir.data();

  if (!opt_.cpu_set.empty()) {
    CPU_ZERO(&cpu_set_);
    for (int i : opt_.cpu_set) CPU_SET(i, &cpu_set_);
    ctx_.cpuset = &cpu_set_;
  }
  ctx_.uid = opt_.uid;
  ctx_.gid = opt_.gid;

  const SandboxOptions::Limits& lim = opt_.limits;
  ctx_.rlim_as = lim.vss_kib;
  ctx_.rlim_core = 0;
  ctx_.rlim_nofile = lim.files;
  ctx_.rlim_fsize = lim.fsize_kib;
  ctx_.rlim_proc = lim.processes;
  ctx_.cg_rss = lim.rss_kib;
  SetTimeval(ctx_.lim_time, lim.wall_us);
  SetTimeval(ctx_.lim_cputime, lim.cpu_us);

  // sized up front: mnt_list_add keeps pointers into mounts_
  mounts_.resize(opt_.dirs.size());
  for (size_t i = 0; i < opt_.dirs.size(); i++) {
    struct jail_mount_ctx& mnt = mounts_[i];
    mnt.type = kBindType;
    mnt.source = mnt.target = opt_.dirs[i].data();
    mnt.fstype = mnt.data = nullptr;
    mnt.flags = MS_RDONLY | MS_NOSUID | MS_NODEV;
    mnt_list_add(mount_list_, &mnt);
  }
  ctx_.mount_cfg = mount_list_;
}

JailContext::~JailContext() {
  mnt_list_free(mount_list_);
}
