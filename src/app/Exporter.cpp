#include "app/Exporter.hpp"
#include <condition_variable>
#include <cstdio>
#include <mutex>

namespace gpuwatch::app {

Exporter::Exporter(const gpuwatch::collectors::GpuDevice& device, IMetricsSink& sink,
                   std::chrono::milliseconds interval, bool verbose)
    : device_(device), sink_(sink), interval_(interval), verbose_(verbose) {}

bool Exporter::tick(std::string& err) {
  gpuwatch::model::MetricsRecord rec{};
  if (!device_.read_metrics(rec, err)) return false;
  if (!sink_.emit(rec, err)) return false;
  ++ticks_;
  if (verbose_) {
    std::fprintf(stderr, "gpuwatch: exporter: tick %llu -> %s (temp=%uC power=%.2fW util=%u%% mem=%.2f/%.1fGB)\n",
                 static_cast<unsigned long long>(ticks_), sink_.name(), rec.temperature_c, rec.power_w,
                 rec.gpu_util_pct, rec.memory_used_gb, rec.memory_total_gb);
  }
  return true;
}

bool Exporter::run(std::stop_token st, uint64_t max_ticks, std::string& err) {
  using clock = std::chrono::steady_clock;
  std::mutex m;
  std::condition_variable_any cv;

  auto next = clock::now();
  while (!st.stop_requested()) {
    if (!tick(err)) return false;
    if (max_ticks > 0 && ticks_ >= max_ticks) break;

    next += interval_;
    auto now = clock::now();
    while (next <= now) next += interval_; // slots overrun by a slow tick are dropped
    std::unique_lock lock(m);
    cv.wait_until(lock, st, next, []{ return false; });
  }
  return true;
}

} // namespace gpuwatch::app
