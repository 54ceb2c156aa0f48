#include "app/MetricsSink.hpp"
#include "app/CloudWatchSink.hpp"
#include "app/ConsoleSink.hpp"
#include <iostream>

namespace gpuwatch::app {

std::unique_ptr<IMetricsSink> make_sink(const ExporterConfig& cfg) {
  if (cfg.sink == SinkKind::CloudWatch)
    return std::make_unique<CloudWatchSink>(cfg.cloudwatch);
  return std::make_unique<ConsoleSink>(std::cout, cfg.format);
}

} // namespace gpuwatch::app
