#pragma once
#include <memory>
#include "app/CloudWatchMapping.hpp"
#include "app/Config.hpp"
#include "app/MetricsSink.hpp"

namespace gpuwatch::app {

// Publishes each record as one PutMetricData call. Credentials and the
// default region come from the AWS SDK's default provider chain.
// Builds without the AWS SDK report "built without CloudWatch support".
class CloudWatchSink final : public IMetricsSink {
public:
  explicit CloudWatchSink(CloudWatchOptions opts);
  ~CloudWatchSink() override;
  CloudWatchSink(const CloudWatchSink&) = delete;
  CloudWatchSink& operator=(const CloudWatchSink&) = delete;

  // Initializes the SDK, builds the client and resolves the instance
  // identity (configured values first, then instance metadata).
  [[nodiscard]] bool open(std::string& err) override;
  [[nodiscard]] bool emit(const gpuwatch::model::MetricsRecord& rec, std::string& err) override;
  [[nodiscard]] const char* name() const override { return "cloudwatch"; }

  [[nodiscard]] const InstanceIdentity& instance() const { return instance_; }

private:
  struct Impl;
  CloudWatchOptions opts_;
  InstanceIdentity instance_;
  std::unique_ptr<Impl> impl_;
};

} // namespace gpuwatch::app
