#pragma once

#include <string>
#include <string_view>
#include "app/RecordSerializer.hpp"

namespace gpuwatch::app {

enum class SinkKind { Stdout, CloudWatch };

struct CloudWatchOptions {
  std::string ns{"GPU"};
  std::string region;            // empty: SDK default chain
  int storage_resolution{60};    // seconds; CloudWatch accepts 1 or 60
  std::string instance_id;       // empty: ask instance metadata
  std::string instance_type;
};

struct ExporterConfig {
  int device_index{0};
  int interval_ms{5000};
  SinkKind sink{SinkKind::Stdout};
  OutputFormat format{OutputFormat::Json};
  CloudWatchOptions cloudwatch;
  std::string nvml_path;
  bool verbose{false};
};

// $XDG_CONFIG_HOME/gpuwatch/config.toml, else ~/.config/gpuwatch/config.toml.
std::string default_config_path();

// Resolve every key TOML -> environment -> compiled default.
// An empty explicit_path falls back to default_config_path(), which may be
// absent; an explicit path that cannot be read is an error.
[[nodiscard]] bool load_config(const std::string& explicit_path, ExporterConfig& out, std::string& err);

[[nodiscard]] bool validate_config(const ExporterConfig& cfg, std::string& err);

[[nodiscard]] bool parse_sink_kind(const std::string& s, SinkKind& out);
[[nodiscard]] const char* sink_kind_name(SinkKind k);

// Environment variable helpers (GPUWATCH_X and gpuwatch_X are equivalent)
const char* getenv_compat(const char* name);

// Whole-string decimal integer; out is untouched on failure.
[[nodiscard]] bool parse_int(std::string_view s, int& out);

} // namespace gpuwatch::app
