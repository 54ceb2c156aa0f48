#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "collectors/ITelemetryBackend.hpp"

namespace gpuwatch::util {

// Runtime NVML loader (dlopen/dlsym).
// Avoids a build-time dependency on nvml.h and the CUDA toolkit; the driver's
// libnvidia-ml is resolved when init() is first called.
class NvmlDyn final : public gpuwatch::collectors::ITelemetryBackend {
public:
  // NVML status codes used outside a successful library call.
  static constexpr int kErrorUninitialized = 1;
  static constexpr int kErrorLibraryNotFound = 12;
  static constexpr int kErrorFunctionNotFound = 13;
  static constexpr int kErrorUnknown = 999;

  // nvml_path: optional explicit library location, honoured only under the
  // trusted library prefixes. verbose: log each load attempt to stderr.
  explicit NvmlDyn(std::string nvml_path = {}, bool verbose = false);
  ~NvmlDyn() override;
  NvmlDyn(const NvmlDyn&) = delete;
  NvmlDyn& operator=(const NvmlDyn&) = delete;

  // Attempt to load libnvidia-ml once (idempotent).
  bool load_once();

  // True if library is loaded and core symbols are present.
  [[nodiscard]] bool available() const { return handle_ != nullptr; }

  // Library candidates in search order for a configured path.
  [[nodiscard]] static std::vector<std::string> candidate_paths(const std::string& configured);

  [[nodiscard]] int init() override;
  [[nodiscard]] int shutdown() override;
  [[nodiscard]] int device_count(unsigned int& count) override;
  [[nodiscard]] int device_handle(unsigned int index, DeviceHandle& dev) override;
  [[nodiscard]] int device_uuid(DeviceHandle dev, std::string& uuid) override;
  [[nodiscard]] int device_name(DeviceHandle dev, std::string& name) override;
  [[nodiscard]] int temperature(DeviceHandle dev, unsigned int& celsius) override;
  [[nodiscard]] int power_usage(DeviceHandle dev, unsigned int& milliwatts) override;
  [[nodiscard]] int memory_info(DeviceHandle dev, uint64_t& total_bytes, uint64_t& used_bytes) override;
  [[nodiscard]] int utilization(DeviceHandle dev, unsigned int& gpu_pct) override;
  [[nodiscard]] std::string error_string(int code) const override;
  [[nodiscard]] const char* name() const override { return "nvml"; }

private:
  std::string nvml_path_;
  bool verbose_{false};
  void* handle_{};
  bool loaded_{false};
  bool missing_symbol_{false};

  using nvmlReturn_t = int; // NVML_SUCCESS == 0
  using nvmlDevice_t = void*;
  struct nvmlMemory_t { unsigned long long total, free, used; };
  struct nvmlUtilization_t { unsigned int gpu, memory; };

  // Signatures
  nvmlReturn_t (*p_nvmlInit_v2)(){};
  nvmlReturn_t (*p_nvmlShutdown)(){};
  const char* (*p_nvmlErrorString)(nvmlReturn_t result){};
  nvmlReturn_t (*p_nvmlDeviceGetCount_v2)(unsigned int* count){};
  nvmlReturn_t (*p_nvmlDeviceGetHandleByIndex_v2)(unsigned int index, nvmlDevice_t* device){};
  nvmlReturn_t (*p_nvmlDeviceGetUUID)(nvmlDevice_t device, char* uuid, unsigned int length){};
  nvmlReturn_t (*p_nvmlDeviceGetName)(nvmlDevice_t device, char* name, unsigned int length){};
  nvmlReturn_t (*p_nvmlDeviceGetMemoryInfo)(nvmlDevice_t device, nvmlMemory_t* mem){};
  nvmlReturn_t (*p_nvmlDeviceGetTemperature)(nvmlDevice_t device, unsigned int sensorType, unsigned int* temp){};
  nvmlReturn_t (*p_nvmlDeviceGetUtilizationRates)(nvmlDevice_t device, nvmlUtilization_t* utilization){};
  nvmlReturn_t (*p_nvmlDeviceGetPowerUsage)(nvmlDevice_t device, unsigned int* milliwatts){};

  bool dlsym_all();
  [[nodiscard]] int not_loaded() const { return missing_symbol_ ? kErrorFunctionNotFound : kErrorUninitialized; }
};

} // namespace gpuwatch::util
