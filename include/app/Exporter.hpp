#pragma once
#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include "app/MetricsSink.hpp"
#include "collectors/GpuDevice.hpp"

namespace gpuwatch::app {

// Fixed-rate sample-and-publish loop over one device and one sink.
// Ticks are scheduled at start + k * interval; a slow tick does not shift
// later ones, and slots it overran are skipped rather than replayed.
// Every failure ends the loop.
class Exporter {
public:
  Exporter(const gpuwatch::collectors::GpuDevice& device, IMetricsSink& sink,
           std::chrono::milliseconds interval, bool verbose = false);
  Exporter(const Exporter&) = delete;
  Exporter& operator=(const Exporter&) = delete;

  // Run until stop is requested, max_ticks records were emitted (0 = no
  // limit) or a tick fails. Returns false with err on failure. The wait
  // between ticks ends as soon as stop is requested.
  [[nodiscard]] bool run(std::stop_token st, uint64_t max_ticks, std::string& err);

  // Sample once and emit. Nothing reaches the sink if any reading fails.
  [[nodiscard]] bool tick(std::string& err);

  [[nodiscard]] uint64_t ticks() const { return ticks_; }

private:
  const gpuwatch::collectors::GpuDevice& device_;
  IMetricsSink& sink_;
  std::chrono::milliseconds interval_;
  bool verbose_;
  uint64_t ticks_{0};
};

} // namespace gpuwatch::app
