#include "minitest.hpp"
#include "app/SignalWatcher.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

template <class Pred>
static bool wait_for(Pred pred, std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

TEST(signal_first_requests_stop_second_forces_exit) {
  std::stop_source stop;
  std::atomic<int> forced{0};
  gpuwatch::app::SignalWatcher watcher(stop, [&forced](int sig) { forced.store(sig); });
  std::string err;
  ASSERT_TRUE(watcher.start({SIGUSR2}, err));

  ASSERT_EQ(::kill(::getpid(), SIGUSR2), 0);
  ASSERT_TRUE(wait_for([&] { return stop.stop_requested(); }, 2000ms));
  ASSERT_EQ(watcher.caught(), SIGUSR2);
  ASSERT_EQ(forced.load(), 0);

  ASSERT_EQ(::kill(::getpid(), SIGUSR2), 0);
  ASSERT_TRUE(wait_for([&] { return forced.load() != 0; }, 2000ms));
  ASSERT_EQ(forced.load(), SIGUSR2);
}

TEST(signal_watcher_idle_until_signalled) {
  std::stop_source stop;
  bool forced = false;
  {
    gpuwatch::app::SignalWatcher watcher(stop, [&forced](int) { forced = true; });
    std::string err;
    ASSERT_TRUE(watcher.start({SIGUSR2}, err));
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(watcher.caught(), 0);
  }
  ASSERT_FALSE(stop.stop_requested());
  ASSERT_FALSE(forced);
}
