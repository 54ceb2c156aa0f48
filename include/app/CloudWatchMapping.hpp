#pragma once
#include <string>
#include <vector>
#include "model/Metrics.hpp"

namespace gpuwatch::app {

enum class MetricUnit { None, Percent, Gigabytes };

struct MetricDimension {
  std::string name;
  std::string value;
};

// SDK-independent form of one CloudWatch datum.
struct MetricDatum {
  std::string name;
  MetricUnit unit{MetricUnit::None};
  double value{};
  int storage_resolution{60};
  std::vector<MetricDimension> dimensions;
};

struct InstanceIdentity {
  std::string id;
  std::string type;
};

// Four datums per record (GPU Usage, Memory Used, Temperature (C), Power (W)),
// each tagged InstanceId/InstanceType, for a single PutMetricData batch.
[[nodiscard]] std::vector<MetricDatum> to_metric_data(const gpuwatch::model::MetricsRecord& rec,
                                                      const InstanceIdentity& instance,
                                                      int storage_resolution);

} // namespace gpuwatch::app
