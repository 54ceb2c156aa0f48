#pragma once
#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <stop_token>
#include <string>
#include <thread>

namespace gpuwatch::app {

// Consumes termination signals on a dedicated thread.
// The first signal requests stop on the given source so the sampling loop
// returns and the backend is shut down once. A stuck tick (a cloud call
// waiting on its SDK timeout, say) would hold that path up, so a second
// signal calls force_exit, which by default ends the process with status 1.
class SignalWatcher {
public:
  using ForceExit = std::function<void(int sig)>;

  explicit SignalWatcher(std::stop_source stop, ForceExit force_exit = {});
  ~SignalWatcher();
  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  // Blocks sigs in the calling thread and starts the watcher. Call before
  // any other thread is created so every thread inherits the mask.
  [[nodiscard]] bool start(std::initializer_list<int> sigs, std::string& err);

  // First signal received, 0 if none.
  [[nodiscard]] int caught() const { return caught_.load(); }

private:
  std::stop_source stop_;
  ForceExit force_exit_;
  sigset_t set_{};
  std::atomic<int> caught_{0};
  std::jthread thread_;

  void watch(std::stop_token st);
};

} // namespace gpuwatch::app
