#include <codebox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

// every console sink shares this mutex; the executor forks from worker threads
// and a mutex held by another thread at fork time stays locked in the child
using console_mutex = spdlog::details::console_mutex;

void Prepare() {
  console_mutex::mutex().lock();
}

void Parent() {
  console_mutex::mutex().unlock();
}

void Child() {
  console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  if (spdlog::get("codebox")) return;
  // stdout carries responses
  auto level = spdlog::get_level();
  spdlog::set_default_logger(spdlog::stderr_color_mt("codebox"));
  spdlog::set_level(level);
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
