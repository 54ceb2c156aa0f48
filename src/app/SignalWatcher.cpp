#include "app/SignalWatcher.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <pthread.h>
#include <utility>

namespace gpuwatch::app {

SignalWatcher::SignalWatcher(std::stop_source stop, ForceExit force_exit)
    : stop_(std::move(stop)), force_exit_(std::move(force_exit)) {
  if (!force_exit_) force_exit_ = [](int) { std::_Exit(1); };
  sigemptyset(&set_);
}

SignalWatcher::~SignalWatcher() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

bool SignalWatcher::start(std::initializer_list<int> sigs, std::string& err) {
  sigemptyset(&set_);
  for (int s : sigs) sigaddset(&set_, s);
  if (int rc = pthread_sigmask(SIG_BLOCK, &set_, nullptr); rc != 0) {
    err = std::string("unable to block termination signals: ") + std::strerror(rc);
    return false;
  }
  thread_ = std::jthread([this](std::stop_token st) { watch(st); });
  return true;
}

void SignalWatcher::watch(std::stop_token st) {
  const timespec wait_step{0, 200'000'000};
  while (!st.stop_requested()) {
    int sig = ::sigtimedwait(&set_, nullptr, &wait_step);
    if (sig <= 0) continue;
    int expected = 0;
    if (caught_.compare_exchange_strong(expected, sig)) {
      std::fprintf(stderr, "gpuwatch: received %s, stopping (send again to exit now)\n", ::strsignal(sig));
      stop_.request_stop();
      continue;
    }
    std::fprintf(stderr, "gpuwatch: received %s again, exiting\n", ::strsignal(sig));
    force_exit_(sig);
    return;
  }
}

} // namespace gpuwatch::app
