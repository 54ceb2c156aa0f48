#pragma once
#include <cstdint>
#include <string>

namespace gpuwatch::collectors {

// Raw view of a vendor telemetry library. Calls return the library's own
// status code (0 on success) and report values in the library's units.
// Lets the device accessor run against NVML or a scripted fake.
class ITelemetryBackend {
public:
  using DeviceHandle = void*;
  static constexpr int kSuccess = 0;

  virtual ~ITelemetryBackend() = default;

  [[nodiscard]] virtual int init() = 0;
  [[nodiscard]] virtual int shutdown() = 0;

  [[nodiscard]] virtual int device_count(unsigned int& count) = 0;
  [[nodiscard]] virtual int device_handle(unsigned int index, DeviceHandle& dev) = 0;
  [[nodiscard]] virtual int device_uuid(DeviceHandle dev, std::string& uuid) = 0;
  [[nodiscard]] virtual int device_name(DeviceHandle dev, std::string& name) = 0;

  [[nodiscard]] virtual int temperature(DeviceHandle dev, unsigned int& celsius) = 0;
  [[nodiscard]] virtual int power_usage(DeviceHandle dev, unsigned int& milliwatts) = 0;
  [[nodiscard]] virtual int memory_info(DeviceHandle dev, uint64_t& total_bytes, uint64_t& used_bytes) = 0;
  [[nodiscard]] virtual int utilization(DeviceHandle dev, unsigned int& gpu_pct) = 0;

  // Human-readable text for a status code returned above.
  [[nodiscard]] virtual std::string error_string(int code) const = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace gpuwatch::collectors
