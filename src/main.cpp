#include "app/Config.hpp"
#include "app/Exporter.hpp"
#include "app/MetricsSink.hpp"
#include "app/SignalWatcher.hpp"
#include "collectors/BackendSession.hpp"
#include "collectors/GpuDevice.hpp"
#include "util/NvmlDyn.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <optional>
#include <stop_token>
#include <string>

namespace {

struct CliOptions {
  std::string config_path;
  std::optional<int> device;
  std::optional<int> interval_ms;
  std::string sink;
  std::string format;
  int iterations{0}; // 0 => run until a signal or an error
  bool help{false};
};

void usage(std::FILE* to) {
  std::fprintf(to,
    "Usage: gpuwatch [--config PATH] [--device N] [--interval-ms MS]\n"
    "                [--sink stdout|cloudwatch] [--format json|csv] [--iterations N]\n"
    "Samples one GPU every interval (default 5000ms) and emits one record per tick.\n"
    "Runs until SIGINT/SIGTERM (a second signal exits at once); any error\n"
    "terminates with status 1.\n"
    "CloudWatch metrics use the InstanceId/InstanceType dimensions and report\n"
    "memory in Gigabytes.\n");
}

bool parse_int_arg(const std::string& flag, const char* v, int& out, std::string& err) {
  if (gpuwatch::app::parse_int(v, out)) return true;
  err = "invalid value for " + flag + ": " + v;
  return false;
}

bool parse_args(int argc, char** argv, CliOptions& o, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&]() -> const char* {
      if (i + 1 < argc) return argv[++i];
      err = "missing value for " + a;
      return nullptr;
    };
    if (a == "-h" || a == "--help") { o.help = true; return true; }
    const char* v = need();
    if (!v) return false;
    int n = 0;
    if (a == "--config") o.config_path = v;
    else if (a == "--sink") o.sink = v;
    else if (a == "--format") o.format = v;
    else if (a == "--device") { if (!parse_int_arg(a, v, n, err)) return false; o.device = n; }
    else if (a == "--interval-ms") { if (!parse_int_arg(a, v, n, err)) return false; o.interval_ms = n; }
    else if (a == "--iterations") {
      if (!parse_int_arg(a, v, n, err)) return false;
      if (n < 0) { err = "--iterations must be >= 0"; return false; }
      o.iterations = n;
    } else {
      err = "unknown option " + a;
      return false;
    }
  }
  return true;
}

bool apply_cli(const CliOptions& o, gpuwatch::app::ExporterConfig& cfg, std::string& err) {
  if (o.device) cfg.device_index = *o.device;
  if (o.interval_ms) cfg.interval_ms = *o.interval_ms;
  if (!o.sink.empty() && !gpuwatch::app::parse_sink_kind(o.sink, cfg.sink)) {
    err = "invalid --sink '" + o.sink + "' (expected stdout or cloudwatch)";
    return false;
  }
  if (!o.format.empty() && !gpuwatch::app::parse_output_format(o.format, cfg.format)) {
    err = "invalid --format '" + o.format + "' (expected json or csv)";
    return false;
  }
  return true;
}

int fatal(const std::string& msg) {
  std::fprintf(stderr, "gpuwatch: fatal: %s\n", msg.c_str());
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  CliOptions cli;
  std::string err;
  if (!parse_args(argc, argv, cli, err)) {
    std::fprintf(stderr, "gpuwatch: %s\n", err.c_str());
    usage(stderr);
    return 1;
  }
  if (cli.help) { usage(stdout); return 0; }

  gpuwatch::app::ExporterConfig cfg;
  if (!gpuwatch::app::load_config(cli.config_path, cfg, err)) return fatal(err);
  if (!apply_cli(cli, cfg, err)) return fatal(err);
  if (!gpuwatch::app::validate_config(cfg, err)) return fatal(err);

  // Termination signals are blocked in every thread and consumed only by
  // the watcher. The first asks the sampling loop to stop; a second one
  // exits at once without shutting NVML down.
  std::stop_source stop;
  gpuwatch::app::SignalWatcher signals(stop);
  if (!signals.start({SIGINT, SIGTERM}, err)) return fatal(err);

  gpuwatch::util::NvmlDyn nvml(cfg.nvml_path, cfg.verbose);
  gpuwatch::collectors::BackendSession session(nvml);
  if (!session.ok()) return fatal("unable to initialize NVML: " + session.error());

  auto device = gpuwatch::collectors::GpuDevice::open(nvml, cfg.device_index, err);
  if (!device) return fatal("unable to get device: " + err);
  const auto& id = device->identity();
  std::fprintf(stderr, "gpuwatch: device %d: %s%s%s%s\n", id.index, id.uuid.c_str(),
               id.name.empty() ? "" : " (", id.name.c_str(), id.name.empty() ? "" : ")");

  auto sink = gpuwatch::app::make_sink(cfg);
  if (!sink->open(err)) return fatal(err);
  std::fprintf(stderr, "gpuwatch: sink=%s format=%s interval=%dms\n", sink->name(),
               gpuwatch::app::output_format_name(cfg.format), cfg.interval_ms);

  gpuwatch::app::Exporter exporter(*device, *sink, std::chrono::milliseconds(cfg.interval_ms), cfg.verbose);
  if (!exporter.run(stop.get_token(), static_cast<uint64_t>(cli.iterations), err))
    return fatal("unable to export metrics: " + err);

  if (!session.close(err)) return fatal(err);
  return signals.caught() != 0 ? 1 : 0;
}
