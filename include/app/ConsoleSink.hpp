#pragma once
#include <iosfwd>
#include "app/MetricsSink.hpp"
#include "app/RecordSerializer.hpp"

namespace gpuwatch::app {

// Newline-delimited records on a stream, flushed per record.
class ConsoleSink final : public IMetricsSink {
public:
  ConsoleSink(std::ostream& out, OutputFormat fmt);

  [[nodiscard]] bool emit(const gpuwatch::model::MetricsRecord& rec, std::string& err) override;
  [[nodiscard]] const char* name() const override { return "stdout"; }

private:
  std::ostream& out_;
  OutputFormat fmt_;
  std::string line_;
};

} // namespace gpuwatch::app
