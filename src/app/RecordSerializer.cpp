#include "app/RecordSerializer.hpp"
#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>

namespace {

bool append_float(std::string& out, float v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{}) return false;
  out.append(buf, ptr);
  return true;
}

bool append_fixed(std::string& out, float v, int precision) {
  char buf[48];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed, precision);
  if (ec != std::errc{}) return false;
  out.append(buf, ptr);
  return true;
}

void append_uint(std::string& out, unsigned int v) {
  char buf[16];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_field(std::string& out, const char* key) {
  out += '"';  out += key;  out += "\":";
}

bool to_json(const gpuwatch::model::MetricsRecord& r, std::string& out) {
  out += '{';
  append_field(out, "temperature");  append_uint(out, r.temperature_c);  out += ',';
  append_field(out, "power");
  if (!append_float(out, r.power_w)) return false;
  out += ',';
  append_field(out, "gpu_usage");  append_uint(out, r.gpu_util_pct);  out += ',';
  append_field(out, "memory_total");
  if (!append_float(out, r.memory_total_gb)) return false;
  out += ',';
  append_field(out, "memory_used");
  if (!append_float(out, r.memory_used_gb)) return false;
  out += '}';
  return true;
}

bool to_csv(const gpuwatch::model::MetricsRecord& r, std::string& out) {
  append_uint(out, r.temperature_c);  out += ',';
  if (!append_fixed(out, r.power_w, 2)) return false;
  out += ',';
  append_uint(out, r.gpu_util_pct);  out += ',';
  if (!append_fixed(out, r.memory_total_gb, 1)) return false;
  out += ',';
  return append_fixed(out, r.memory_used_gb, 2);
}

} // anonymous namespace

namespace gpuwatch::app {

bool parse_output_format(const std::string& s, OutputFormat& out) {
  if (s == "json") { out = OutputFormat::Json; return true; }
  if (s == "csv")  { out = OutputFormat::Csv;  return true; }
  return false;
}

const char* output_format_name(OutputFormat f) {
  return f == OutputFormat::Csv ? "csv" : "json";
}

bool serialize_record(const gpuwatch::model::MetricsRecord& rec, OutputFormat fmt,
                      std::string& out, std::string& err) {
  for (float v : {rec.power_w, rec.memory_total_gb, rec.memory_used_gb}) {
    if (!std::isfinite(v)) {
      err = "unable to serialize metrics: non-finite reading";
      return false;
    }
  }
  std::string line;
  line.reserve(128);
  bool ok = (fmt == OutputFormat::Csv) ? to_csv(rec, line) : to_json(rec, line);
  if (!ok) {
    err = std::string("unable to serialize metrics as ") + output_format_name(fmt);
    return false;
  }
  out = std::move(line);
  return true;
}

} // namespace gpuwatch::app
