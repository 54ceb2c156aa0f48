#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <charconv>
#include <system_error>
#include <cstdlib>
#include <string>
#include <string_view>

namespace gpuwatch::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("GPUWATCH_", 0) == 0) {
    alt = std::string("gpuwatch_") + n.substr(9);
  } else if (n.rfind("gpuwatch_", 0) == 0) {
    alt = std::string("GPUWATCH_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool parse_int(std::string_view s, int& out) {
  int n = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) return false;
  out = n;
  return true;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string default_config_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/gpuwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/gpuwatch/config.toml";
  return {};
}

// A key that is set but not a whole integer is an error, not a default.
static bool resolve_int(const gpuwatch::util::TomlReader& toml, bool have_toml,
                        const char* section, const char* key,
                        const char* env_name, int& value, std::string& err) {
  std::string raw;
  std::string source;
  if (have_toml && toml.has(section, key)) {
    raw = toml.get_string(section, key);
    source = std::string(section) + "." + key;
  } else if (const char* v = getenv_compat(env_name)) {
    raw = v;
    source = env_name;
  } else {
    return true;
  }
  if (parse_int(raw, value)) return true;
  err = "invalid " + source + " '" + raw + "' (expected an integer)";
  return false;
}

static bool resolve_bool(const gpuwatch::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool& value, std::string& err) {
  if (have_toml && toml.has(section, key)) {
    // Unrecognized text is the only case where the fallback shows through
    bool as_true = toml.get_bool(section, key, true);
    if (as_true == toml.get_bool(section, key, false)) {
      value = as_true;
      return true;
    }
    err = std::string("invalid ") + section + "." + key + " '" + toml.get_string(section, key) +
          "' (expected true or false)";
    return false;
  }
  value = env_flag(env_name, value);
  return true;
}

static std::string resolve_string(const gpuwatch::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  const char* v = getenv_compat(env_name);
  if (v && *v) return std::string(v);
  return def;
}

bool parse_sink_kind(const std::string& s, SinkKind& out) {
  if (s == "stdout" || s == "console") { out = SinkKind::Stdout; return true; }
  if (s == "cloudwatch") { out = SinkKind::CloudWatch; return true; }
  return false;
}

const char* sink_kind_name(SinkKind k) {
  return k == SinkKind::CloudWatch ? "cloudwatch" : "stdout";
}

bool load_config(const std::string& explicit_path, ExporterConfig& out, std::string& err) {
  ExporterConfig c{};
  gpuwatch::util::TomlReader toml;
  bool have_toml = false;
  if (!explicit_path.empty()) {
    if (!toml.load(explicit_path)) {
      err = "unable to read config file " + explicit_path;
      return false;
    }
    have_toml = true;
  } else {
    auto path = default_config_path();
    have_toml = !path.empty() && toml.load(path);
  }

  // --- [device] / [sampling] ---
  if (!resolve_int(toml, have_toml, "device", "index", "GPUWATCH_DEVICE_INDEX", c.device_index, err)) return false;
  if (!resolve_int(toml, have_toml, "sampling", "interval_ms", "GPUWATCH_INTERVAL_MS", c.interval_ms, err)) return false;

  // --- [output] ---
  auto sink = resolve_string(toml, have_toml, "output", "sink", "GPUWATCH_SINK", sink_kind_name(c.sink));
  if (!parse_sink_kind(sink, c.sink)) {
    err = "invalid output.sink '" + sink + "' (expected stdout or cloudwatch)";
    return false;
  }
  auto format = resolve_string(toml, have_toml, "output", "format", "GPUWATCH_FORMAT", output_format_name(c.format));
  if (!parse_output_format(format, c.format)) {
    err = "invalid output.format '" + format + "' (expected json or csv)";
    return false;
  }

  // --- [cloudwatch] ---
  auto& cw = c.cloudwatch;
  cw.ns                 = resolve_string(toml, have_toml, "cloudwatch", "namespace",          "GPUWATCH_CW_NAMESPACE",  cw.ns);
  cw.region             = resolve_string(toml, have_toml, "cloudwatch", "region",             "GPUWATCH_CW_REGION",     cw.region);
  cw.instance_id        = resolve_string(toml, have_toml, "cloudwatch", "instance_id",        "GPUWATCH_INSTANCE_ID",   cw.instance_id);
  cw.instance_type      = resolve_string(toml, have_toml, "cloudwatch", "instance_type",      "GPUWATCH_INSTANCE_TYPE", cw.instance_type);
  if (!resolve_int(toml, have_toml, "cloudwatch", "storage_resolution", "GPUWATCH_CW_RESOLUTION",
                   cw.storage_resolution, err))
    return false;

  // --- [nvml] / [log] ---
  c.nvml_path = resolve_string(toml, have_toml, "nvml", "path", "GPUWATCH_NVML_PATH", c.nvml_path);
  if (!resolve_bool(toml, have_toml, "log", "verbose", "GPUWATCH_VERBOSE", c.verbose, err)) return false;

  out = std::move(c);
  return true;
}

bool validate_config(const ExporterConfig& cfg, std::string& err) {
  if (cfg.device_index < 0) {
    err = "device index must be >= 0 (got " + std::to_string(cfg.device_index) + ")";
    return false;
  }
  if (cfg.interval_ms <= 0) {
    err = "sampling interval must be positive (got " + std::to_string(cfg.interval_ms) + "ms)";
    return false;
  }
  if (cfg.sink == SinkKind::CloudWatch) {
    if (cfg.cloudwatch.ns.empty()) {
      err = "cloudwatch.namespace must not be empty";
      return false;
    }
    int res = cfg.cloudwatch.storage_resolution;
    if (res != 1 && res != 60) {
      err = "cloudwatch.storage_resolution must be 1 or 60 (got " + std::to_string(res) + ")";
      return false;
    }
  }
  return true;
}

} // namespace gpuwatch::app
