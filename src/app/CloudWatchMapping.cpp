#include "app/CloudWatchMapping.hpp"

namespace gpuwatch::app {

std::vector<MetricDatum> to_metric_data(const gpuwatch::model::MetricsRecord& rec,
                                        const InstanceIdentity& instance,
                                        int storage_resolution) {
  const std::vector<MetricDimension> dims = {
    {"InstanceId", instance.id},
    {"InstanceType", instance.type},
  };
  auto datum = [&](const char* name, MetricUnit unit, double value) {
    return MetricDatum{name, unit, value, storage_resolution, dims};
  };
  return {
    datum("GPU Usage",       MetricUnit::Percent,   static_cast<double>(rec.gpu_util_pct)),
    datum("Memory Used",     MetricUnit::Gigabytes, static_cast<double>(rec.memory_used_gb)),
    datum("Temperature (C)", MetricUnit::None,      static_cast<double>(rec.temperature_c)),
    datum("Power (W)",       MetricUnit::None,      static_cast<double>(rec.power_w)),
  };
}

} // namespace gpuwatch::app
