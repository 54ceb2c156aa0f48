#include "util/NvmlDyn.hpp"
#include <cstdio>
#include <dlfcn.h>
#include <string>
#include <utility>
#include <vector>

namespace gpuwatch::util {

static const int NVML_SUCCESS = 0;
static const unsigned int NVML_TEMPERATURE_GPU = 0; // core sensor
static const unsigned int NVML_DEVICE_UUID_V2_BUFFER_SIZE = 96;
static const unsigned int NVML_DEVICE_NAME_V2_BUFFER_SIZE = 96;

NvmlDyn::NvmlDyn(std::string nvml_path, bool verbose)
    : nvml_path_(std::move(nvml_path)), verbose_(verbose) {}

NvmlDyn::~NvmlDyn() {
  if (handle_) ::dlclose(handle_);
}

std::vector<std::string> NvmlDyn::candidate_paths(const std::string& configured) {
  std::vector<std::string> candidates;

  if (!configured.empty()) {
    static const std::vector<std::string> allowed_prefixes = {
      "/usr/lib", "/usr/lib64", "/usr/local/lib", "/usr/local/lib64",
      "/opt/nvidia", "/opt/cuda"
    };
    bool valid = false;
    for (const auto& prefix : allowed_prefixes) {
      if (configured.rfind(prefix + "/", 0) == 0) { valid = true; break; }
    }
    if (valid && configured.find("/../") == std::string::npos) {
      candidates.emplace_back(configured);
    } else {
      std::fprintf(stderr, "gpuwatch: nvml: path rejected (untrusted prefix): %s\n", configured.c_str());
    }
  }

  candidates.emplace_back("libnvidia-ml.so.1");
  candidates.emplace_back("libnvidia-ml.so");
  return candidates;
}

bool NvmlDyn::load_once() {
  if (loaded_) return handle_ != nullptr;
  loaded_ = true;

  for (const auto& lib : candidate_paths(nvml_path_)) {
    handle_ = ::dlopen(lib.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (verbose_) {
      std::fprintf(stderr, "gpuwatch: nvml: dlopen %s: %s\n", lib.c_str(),
                   handle_ ? "ok" : ::dlerror());
    }
    if (handle_) break;
  }
  if (!handle_) return false;
  if (!dlsym_all()) {
    std::fprintf(stderr, "gpuwatch: nvml: library is missing required symbols\n");
    missing_symbol_ = true;
    ::dlclose(handle_); handle_ = nullptr; return false;
  }
  return true;
}

bool NvmlDyn::dlsym_all() {
  auto L = [&](const char* sym){ return ::dlsym(handle_, sym); };
  p_nvmlInit_v2 = (nvmlReturn_t (*)())L("nvmlInit_v2");
  p_nvmlShutdown = (nvmlReturn_t (*)())L("nvmlShutdown");
  p_nvmlErrorString = (const char* (*)(nvmlReturn_t))L("nvmlErrorString");
  p_nvmlDeviceGetCount_v2 = (nvmlReturn_t (*)(unsigned int*))L("nvmlDeviceGetCount_v2");
  p_nvmlDeviceGetHandleByIndex_v2 = (nvmlReturn_t (*)(unsigned int, nvmlDevice_t*))L("nvmlDeviceGetHandleByIndex_v2");
  p_nvmlDeviceGetUUID = (nvmlReturn_t (*)(nvmlDevice_t, char*, unsigned int))L("nvmlDeviceGetUUID");
  p_nvmlDeviceGetName = (nvmlReturn_t (*)(nvmlDevice_t, char*, unsigned int))L("nvmlDeviceGetName");
  p_nvmlDeviceGetMemoryInfo = (nvmlReturn_t (*)(nvmlDevice_t, nvmlMemory_t*))L("nvmlDeviceGetMemoryInfo");
  p_nvmlDeviceGetTemperature = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*))L("nvmlDeviceGetTemperature");
  p_nvmlDeviceGetUtilizationRates = (nvmlReturn_t (*)(nvmlDevice_t, nvmlUtilization_t*))L("nvmlDeviceGetUtilizationRates");
  p_nvmlDeviceGetPowerUsage = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int*))L("nvmlDeviceGetPowerUsage");
  // Name and error text are optional; everything the record needs is not.
  return p_nvmlInit_v2 && p_nvmlShutdown && p_nvmlDeviceGetCount_v2 && p_nvmlDeviceGetHandleByIndex_v2 &&
         p_nvmlDeviceGetUUID && p_nvmlDeviceGetMemoryInfo && p_nvmlDeviceGetTemperature &&
         p_nvmlDeviceGetUtilizationRates && p_nvmlDeviceGetPowerUsage;
}

int NvmlDyn::init() {
  if (!load_once()) return missing_symbol_ ? kErrorFunctionNotFound : kErrorLibraryNotFound;
  return p_nvmlInit_v2();
}

int NvmlDyn::shutdown() {
  if (!available()) return not_loaded();
  return p_nvmlShutdown();
}

int NvmlDyn::device_count(unsigned int& count) {
  if (!available()) return not_loaded();
  return p_nvmlDeviceGetCount_v2(&count);
}

int NvmlDyn::device_handle(unsigned int index, DeviceHandle& dev) {
  if (!available()) return not_loaded();
  nvmlDevice_t d{};
  int rc = p_nvmlDeviceGetHandleByIndex_v2(index, &d);
  if (rc == NVML_SUCCESS) dev = d;
  return rc;
}

int NvmlDyn::device_uuid(DeviceHandle dev, std::string& uuid) {
  if (!available()) return not_loaded();
  char buf[NVML_DEVICE_UUID_V2_BUFFER_SIZE]; buf[0] = '\0';
  int rc = p_nvmlDeviceGetUUID(dev, buf, sizeof(buf));
  if (rc == NVML_SUCCESS) uuid = buf;
  return rc;
}

int NvmlDyn::device_name(DeviceHandle dev, std::string& name) {
  if (!available()) return not_loaded();
  if (!p_nvmlDeviceGetName) return kErrorFunctionNotFound;
  char buf[NVML_DEVICE_NAME_V2_BUFFER_SIZE]; buf[0] = '\0';
  int rc = p_nvmlDeviceGetName(dev, buf, sizeof(buf));
  if (rc == NVML_SUCCESS) name = buf;
  return rc;
}

int NvmlDyn::temperature(DeviceHandle dev, unsigned int& celsius) {
  if (!available()) return not_loaded();
  return p_nvmlDeviceGetTemperature(dev, NVML_TEMPERATURE_GPU, &celsius);
}

int NvmlDyn::power_usage(DeviceHandle dev, unsigned int& milliwatts) {
  if (!available()) return not_loaded();
  return p_nvmlDeviceGetPowerUsage(dev, &milliwatts);
}

int NvmlDyn::memory_info(DeviceHandle dev, uint64_t& total_bytes, uint64_t& used_bytes) {
  if (!available()) return not_loaded();
  nvmlMemory_t mem{};
  int rc = p_nvmlDeviceGetMemoryInfo(dev, &mem);
  if (rc == NVML_SUCCESS) { total_bytes = mem.total; used_bytes = mem.used; }
  return rc;
}

int NvmlDyn::utilization(DeviceHandle dev, unsigned int& gpu_pct) {
  if (!available()) return not_loaded();
  nvmlUtilization_t ur{};
  int rc = p_nvmlDeviceGetUtilizationRates(dev, &ur);
  if (rc == NVML_SUCCESS) gpu_pct = ur.gpu;
  return rc;
}

std::string NvmlDyn::error_string(int code) const {
  if (available() && p_nvmlErrorString) {
    if (const char* s = p_nvmlErrorString(code); s && *s) return s;
  }
  // Library absent: same wording NVML uses for the codes we can hit here.
  switch (code) {
    case 0:  return "Success";
    case 1:  return "Uninitialized";
    case 2:  return "Invalid Argument";
    case 3:  return "Not Supported";
    case 4:  return "Insufficient Permissions";
    case 6:  return "Not Found";
    case 9:  return "Driver Not Loaded";
    case 12: return "NVML Shared Library Not Found";
    case 13: return "Function Not Found";
    case 15: return "GPU is lost";
    default: return "Unknown Error (" + std::to_string(code) + ")";
  }
}

} // namespace gpuwatch::util
