#pragma once
#include <memory>
#include <string>
#include "app/Config.hpp"
#include "model/Metrics.hpp"

namespace gpuwatch::app {

// Destination for metrics records (console or cloud API).
class IMetricsSink {
public:
  virtual ~IMetricsSink() = default;

  // Acquire clients/identity before the first emit. Default: nothing to do.
  [[nodiscard]] virtual bool open(std::string& err) { (void)err; return true; }

  // Deliver one record. A false return is fatal to the exporter.
  [[nodiscard]] virtual bool emit(const gpuwatch::model::MetricsRecord& rec, std::string& err) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

// Sink selected by cfg.sink. Console sinks write to std::cout.
std::unique_ptr<IMetricsSink> make_sink(const ExporterConfig& cfg);

} // namespace gpuwatch::app
