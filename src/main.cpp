#include <fcntl.h>
#include <unistd.h>
#include <thread>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codebox/logger.h>
#include <codebox/executor.h>
#include <codebox/submission.h>
#include "codebox/paths.h"
#include "codebox/broker.h"
#include "codebox/artifact_store.h"
#include "cpuset.h"
#include "request_io.h"

namespace {

bool to_lock = true;
std::string once_file;

bool ReadToken(const fs::path& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::error("Failed to read artifact store token from {}", path.c_str());
    return false;
  }
  std::getline(fin, kArtifactStoreToken);
  while (kArtifactStoreToken.size() && isspace((unsigned char)kArtifactStoreToken.back())) {
    kArtifactStoreToken.pop_back();
  }
  return true;
}

bool SetPinnedCpus(const std::string& str) {
  if (!CpusetParse(str, &kPinnedCpus, std::thread::hardware_concurrency())) {
    spdlog::error("Invalid CPU list: {}", str);
    return false;
  }
  return true;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string python = ini[""]["python"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (python.size()) kPythonPath = python;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  if (std::string pinned_cpus = ini[""]["pinned_cpus"] | ""; pinned_cpus.size()) {
    if (!SetPinnedCpus(pinned_cpus)) return false;
  }
  kMaxQueue = ini[""]["max_queue"] | kMaxQueue;

  kDefaultLimits.timeout_seconds = ini[""]["default_timeout_seconds"] | kDefaultLimits.timeout_seconds;
  kMaxLimits.timeout_seconds = ini[""]["max_timeout_seconds"] | kMaxLimits.timeout_seconds;
  kDefaultLimits.memory_mb = ini[""]["default_memory_mb"] | kDefaultLimits.memory_mb;
  kMaxLimits.memory_mb = ini[""]["max_memory_mb"] | kMaxLimits.memory_mb;
  kDefaultLimits.cpu_cores = ini[""]["default_cpu_cores"] | kDefaultLimits.cpu_cores;
  kMaxLimits.cpu_cores = ini[""]["max_cpu_cores"] | kMaxLimits.cpu_cores;

  kGraceSeconds = ini[""]["grace_seconds"] | kGraceSeconds;
  kMaxOutputBytes = ini[""]["max_output_bytes"] | kMaxOutputBytes;
  kScratchKiB = (ini[""]["scratch_mb"] | (kScratchKiB / 1024)) * 1024;

  kArtifactStoreUrl = ini[""]["artifact_store_url"] | kArtifactStoreUrl;
  kArtifactRetries = ini[""]["artifact_retries"] | kArtifactRetries;
  kMaxArtifacts = ini[""]["max_artifacts"] | kMaxArtifacts;
  kMaxFetchBytes = ini[""]["max_fetch_bytes"] | kMaxFetchBytes;
  if (std::string token_file = ini[""]["artifact_store_token_file"] | ""; token_file.size()) {
    if (!ReadToken(token_file)) return false;
  }
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/codebox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");
  parser.add_argument("--pinned-cpus")
    .default_value(std::string(""))
    .help("Comma-separated list of CPUs to pin or simply \"all\"");
  parser.add_argument("--once")
    .default_value(std::string(""))
    .help("Run the single JSON request in this file and exit");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (kMaxParallel < 1) kMaxParallel = 1;
  to_lock = parser["--no-lock"] == false;
  if (auto pinned_cpus = parser.get<std::string>("--pinned-cpus"); pinned_cpus.size()) {
    if (!SetPinnedCpus(pinned_cpus)) exit(1);
  }
  once_file = parser.get<std::string>("--once");
  if (const char* token = getenv("CODEBOX_ARTIFACT_TOKEN"); token && *token) {
    kArtifactStoreToken = token;
  }
}

bool LockFile() {
  int fd = open(LockFilePath().c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  spdlog::set_pattern("[%t] %+");
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  if (once_file.size()) {
    std::ifstream fin(once_file);
    if (!fin) {
      spdlog::error("Failed to open {}", once_file);
      return 1;
    }
    std::stringstream ss;
    ss << fin.rdbuf();
    return ServeOne(ss.str(), std::cout) ? 0 : 2;
  }
  if (to_lock && !LockFile()) {
    spdlog::error("Another codebox instance is running.");
    return 1;
  }
  std::thread work_thread(WorkLoop, true);
  work_thread.detach();
  ServeRequests(std::cin, std::cout);
}
