#include <trainer/logger.h>

#include <pthread.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// all colour console sinks share this mutex; a fork while another thread
// holds it would leave the child's copy locked forever
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Child() {
  spdlog::details::console_mutex::mutex().unlock();
}

void Parent() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  static std::once_flag flag;
  std::call_once(flag, []() {
    spdlog::debug("Setup logger pthread_atfork");
    pthread_atfork(Prepare, Parent, Child);
  });
}
