#include <sandcell/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

namespace {

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

// Console sink mutexes are held across fork so that a child never starts
// with one of them locked
template <class Func>
void ForEachConsoleSink(Func&& func) {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) func(ptr->mutex_);
  }
}

void Prepare() {
  ForEachConsoleSink([](auto& mtx) { mtx.lock(); });
}

void Release() {
  ForEachConsoleSink([](auto& mtx) { mtx.unlock(); });
}

} // namespace

int VerbosityToLevel(int verbosity) {
  switch (verbosity) {
    case 0: return spdlog::level::warn;
    case 1: return spdlog::level::info;
    default: return spdlog::level::debug;
  }
}

void InitLogger(int verbosity) {
  spdlog::set_pattern("[%t] %+");
  spdlog::set_level((spdlog::level::level_enum)VerbosityToLevel(verbosity));
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}
