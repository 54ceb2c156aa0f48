#pragma once
#include <string>
#include "model/Metrics.hpp"

namespace gpuwatch::app {

enum class OutputFormat { Json, Csv };

// "json" / "csv"; returns false for anything else.
[[nodiscard]] bool parse_output_format(const std::string& s, OutputFormat& out);
[[nodiscard]] const char* output_format_name(OutputFormat f);

// One line, no trailing newline:
//   Json: {"temperature":45,"power":128,"gpu_usage":37,"memory_total":16,"memory_used":0.5}
//   Csv:  45,128.00,37,16.0,0.50
// Fails on non-finite readings, which neither form can carry.
[[nodiscard]] bool serialize_record(const gpuwatch::model::MetricsRecord& rec, OutputFormat fmt,
                                    std::string& out, std::string& err);

} // namespace gpuwatch::app
