#include "app/CloudWatchSink.hpp"
#include <aws/core/Aws.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/internal/AWSHttpResourceClient.h>
#include <aws/monitoring/CloudWatchClient.h>
#include <aws/monitoring/model/Dimension.h>
#include <aws/monitoring/model/MetricDatum.h>
#include <aws/monitoring/model/PutMetricDataRequest.h>
#include <aws/monitoring/model/StandardUnit.h>
#include <cstdio>
#include <utility>

namespace gpuwatch::app {

namespace cw = Aws::CloudWatch::Model;

struct CloudWatchSink::Impl {
  Aws::SDKOptions options;
  bool api_initialized{false};
  std::unique_ptr<Aws::CloudWatch::CloudWatchClient> client;

  ~Impl() {
    // Clients must go before the SDK is torn down
    client.reset();
    if (api_initialized) Aws::ShutdownAPI(options);
  }
};

static cw::StandardUnit to_sdk_unit(MetricUnit u) {
  switch (u) {
    case MetricUnit::Percent:   return cw::StandardUnit::Percent;
    case MetricUnit::Gigabytes: return cw::StandardUnit::Gigabytes;
    case MetricUnit::None:      break;
  }
  return cw::StandardUnit::None;
}

// Instance metadata lookup; empty string when not running on EC2.
static std::string imds_lookup(const char* resource) {
  Aws::Internal::EC2MetadataClient imds;
  auto value = imds.GetResource(resource);
  return std::string(value.c_str());
}

CloudWatchSink::CloudWatchSink(CloudWatchOptions opts)
    : opts_(std::move(opts)), impl_(std::make_unique<Impl>()) {
  instance_.id = opts_.instance_id;
  instance_.type = opts_.instance_type;
}

CloudWatchSink::~CloudWatchSink() = default;

bool CloudWatchSink::open(std::string& err) {
  if (!impl_->api_initialized) {
    Aws::InitAPI(impl_->options);
    impl_->api_initialized = true;
  }

  if (instance_.id.empty()) instance_.id = imds_lookup("/latest/meta-data/instance-id");
  if (instance_.type.empty()) instance_.type = imds_lookup("/latest/meta-data/instance-type");
  if (instance_.id.empty() || instance_.type.empty()) {
    err = "unable to determine instance identity (set cloudwatch.instance_id and cloudwatch.instance_type)";
    return false;
  }

  Aws::Client::ClientConfiguration cc;
  if (!opts_.region.empty()) cc.region = opts_.region.c_str();
  impl_->client = std::make_unique<Aws::CloudWatch::CloudWatchClient>(cc);
  std::fprintf(stderr, "gpuwatch: cloudwatch: namespace=%s instance=%s (%s) resolution=%ds\n",
               opts_.ns.c_str(), instance_.id.c_str(), instance_.type.c_str(), opts_.storage_resolution);
  return true;
}

bool CloudWatchSink::emit(const gpuwatch::model::MetricsRecord& rec, std::string& err) {
  if (!impl_->client) {
    err = "cloudwatch sink used before open()";
    return false;
  }

  cw::PutMetricDataRequest request;
  request.SetNamespace(opts_.ns.c_str());
  for (const auto& d : to_metric_data(rec, instance_, opts_.storage_resolution)) {
    cw::MetricDatum datum;
    datum.SetMetricName(d.name.c_str());
    datum.SetUnit(to_sdk_unit(d.unit));
    datum.SetValue(d.value);
    datum.SetStorageResolution(d.storage_resolution);
    for (const auto& dim : d.dimensions) {
      datum.AddDimensions(cw::Dimension().WithName(dim.name.c_str()).WithValue(dim.value.c_str()));
    }
    request.AddMetricData(std::move(datum));
  }

  auto outcome = impl_->client->PutMetricData(request);
  if (!outcome.IsSuccess()) {
    const auto& e = outcome.GetError();
    err = std::string("unable to publish metrics to CloudWatch: ") + e.GetExceptionName().c_str() +
          ": " + e.GetMessage().c_str();
    return false;
  }
  return true;
}

} // namespace gpuwatch::app
