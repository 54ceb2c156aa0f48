#pragma once
#include <memory>
#include <string>
#include "collectors/ITelemetryBackend.hpp"
#include "model/Metrics.hpp"

namespace gpuwatch::collectors {

// Read-only accessor for one GPU. The handle is resolved once in open() and
// every getter is a single library call with unit conversion; failures are
// reported through err using the library's own error text.
class GpuDevice {
public:
  // Resolve device `index`. The index is checked against the device count
  // before any handle or reading is requested.
  [[nodiscard]] static std::unique_ptr<GpuDevice> open(ITelemetryBackend& backend, int index,
                                                       std::string& err);

  [[nodiscard]] const gpuwatch::model::DeviceIdentity& identity() const { return id_; }

  [[nodiscard]] bool temperature(unsigned int& celsius, std::string& err) const;
  // Milliwatts from the library, watts here.
  [[nodiscard]] bool power(float& watts, std::string& err) const;
  [[nodiscard]] bool utilization(unsigned int& gpu_pct, std::string& err) const;
  // Bytes from the library, gigabytes (2^30) here.
  [[nodiscard]] bool memory(float& total_gb, float& used_gb, std::string& err) const;

  // All four readings as one record. Leaves `out` untouched on any failure.
  [[nodiscard]] bool read_metrics(gpuwatch::model::MetricsRecord& out, std::string& err) const;

private:
  GpuDevice(ITelemetryBackend& backend, ITelemetryBackend::DeviceHandle handle,
            gpuwatch::model::DeviceIdentity id);
  [[nodiscard]] bool check(int rc, const char* what, std::string& err) const;

  ITelemetryBackend& backend_;
  ITelemetryBackend::DeviceHandle handle_;
  gpuwatch::model::DeviceIdentity id_;
};

} // namespace gpuwatch::collectors
