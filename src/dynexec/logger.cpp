#include <dynexec/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

// every color console sink shares this mutex; a child forked while another
// thread holds it would deadlock on its first log line
void LockSinks() {
  spdlog::details::console_mutex::mutex().lock();
}

void UnlockSinks() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger(int verbosity) {
  static bool registered = false;
  if (!registered) {
    // stdout carries the result envelope
    spdlog::set_default_logger(spdlog::stderr_color_mt("dynexec"));
  }
  spdlog::set_pattern("[%t] %+");
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (registered) return;
  registered = true;
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(LockSinks, UnlockSinks, UnlockSinks);
}
