#pragma once
#include <cstdint>
#include <string>

namespace gpuwatch::model {

// One sampling tick of a single GPU. Built once, handed to a sink, dropped.
struct MetricsRecord {
  unsigned int temperature_c{};   // core sensor
  float power_w{};                // board draw
  unsigned int gpu_util_pct{};    // 0..100
  float memory_total_gb{};        // bytes / 2^30
  float memory_used_gb{};
};

struct DeviceIdentity {
  int index{-1};
  std::string uuid;
  std::string name; // empty when the library does not report one
};

} // namespace gpuwatch::model
