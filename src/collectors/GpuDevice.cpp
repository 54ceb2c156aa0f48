#include "collectors/GpuDevice.hpp"
#include <utility>

namespace gpuwatch::collectors {

static constexpr float kBytesPerGigabyte = static_cast<float>(1ull << 30);

GpuDevice::GpuDevice(ITelemetryBackend& backend, ITelemetryBackend::DeviceHandle handle,
                     gpuwatch::model::DeviceIdentity id)
    : backend_(backend), handle_(handle), id_(std::move(id)) {}

std::unique_ptr<GpuDevice> GpuDevice::open(ITelemetryBackend& backend, int index, std::string& err) {
  unsigned int count = 0;
  int rc = backend.device_count(count);
  if (rc != ITelemetryBackend::kSuccess) {
    err = "unable to get device count: " + backend.error_string(rc);
    return nullptr;
  }
  if (index < 0 || static_cast<unsigned int>(index) >= count) {
    err = "device index " + std::to_string(index) + " out of range (" + std::to_string(count) + " devices)";
    return nullptr;
  }

  ITelemetryBackend::DeviceHandle handle{};
  rc = backend.device_handle(static_cast<unsigned int>(index), handle);
  if (rc != ITelemetryBackend::kSuccess) {
    err = "unable to get device at index " + std::to_string(index) + ": " + backend.error_string(rc);
    return nullptr;
  }

  gpuwatch::model::DeviceIdentity id;
  id.index = index;
  rc = backend.device_uuid(handle, id.uuid);
  if (rc != ITelemetryBackend::kSuccess) {
    err = "unable to get uuid of device at index " + std::to_string(index) + ": " + backend.error_string(rc);
    return nullptr;
  }
  // Name is informational only
  if (backend.device_name(handle, id.name) != ITelemetryBackend::kSuccess) id.name.clear();

  return std::unique_ptr<GpuDevice>(new GpuDevice(backend, handle, std::move(id)));
}

bool GpuDevice::check(int rc, const char* what, std::string& err) const {
  if (rc == ITelemetryBackend::kSuccess) return true;
  err = std::string("unable to read ") + what + ": " + backend_.error_string(rc);
  return false;
}

bool GpuDevice::temperature(unsigned int& celsius, std::string& err) const {
  unsigned int t = 0;
  if (!check(backend_.temperature(handle_, t), "temperature", err)) return false;
  celsius = t;
  return true;
}

bool GpuDevice::power(float& watts, std::string& err) const {
  unsigned int mw = 0;
  if (!check(backend_.power_usage(handle_, mw), "power usage", err)) return false;
  watts = static_cast<float>(mw) / 1000.0f;
  return true;
}

bool GpuDevice::utilization(unsigned int& gpu_pct, std::string& err) const {
  unsigned int u = 0;
  if (!check(backend_.utilization(handle_, u), "utilization", err)) return false;
  gpu_pct = u;
  return true;
}

bool GpuDevice::memory(float& total_gb, float& used_gb, std::string& err) const {
  uint64_t total = 0, used = 0;
  if (!check(backend_.memory_info(handle_, total, used), "memory info", err)) return false;
  total_gb = static_cast<float>(total) / kBytesPerGigabyte;
  used_gb = static_cast<float>(used) / kBytesPerGigabyte;
  return true;
}

bool GpuDevice::read_metrics(gpuwatch::model::MetricsRecord& out, std::string& err) const {
  gpuwatch::model::MetricsRecord rec{};
  if (!temperature(rec.temperature_c, err)) return false;
  if (!power(rec.power_w, err)) return false;
  if (!memory(rec.memory_total_gb, rec.memory_used_gb, err)) return false;
  if (!utilization(rec.gpu_util_pct, err)) return false;
  out = rec;
  return true;
}

} // namespace gpuwatch::collectors
