#include "app/CloudWatchSink.hpp"
#include <utility>

namespace gpuwatch::app {

struct CloudWatchSink::Impl {};

CloudWatchSink::CloudWatchSink(CloudWatchOptions opts) : opts_(std::move(opts)) {
  instance_.id = opts_.instance_id;
  instance_.type = opts_.instance_type;
}

CloudWatchSink::~CloudWatchSink() = default;

bool CloudWatchSink::open(std::string& err) {
  err = "built without CloudWatch support (AWS SDK for C++ not found at configure time)";
  return false;
}

bool CloudWatchSink::emit(const gpuwatch::model::MetricsRecord&, std::string& err) {
  err = "built without CloudWatch support";
  return false;
}

} // namespace gpuwatch::app
