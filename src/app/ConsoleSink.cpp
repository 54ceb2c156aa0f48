#include "app/ConsoleSink.hpp"
#include <ostream>

namespace gpuwatch::app {

ConsoleSink::ConsoleSink(std::ostream& out, OutputFormat fmt) : out_(out), fmt_(fmt) {}

bool ConsoleSink::emit(const gpuwatch::model::MetricsRecord& rec, std::string& err) {
  if (!serialize_record(rec, fmt_, line_, err)) return false;
  line_ += '\n';
  out_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  out_.flush();
  if (!out_) {
    err = "unable to write metrics to output stream";
    return false;
  }
  return true;
}

} // namespace gpuwatch::app
