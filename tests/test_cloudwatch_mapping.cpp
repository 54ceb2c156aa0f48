#include "minitest.hpp"
#include "app/CloudWatchMapping.hpp"
#include "app/CloudWatchSink.hpp"
#include <string>

using gpuwatch::app::MetricUnit;

static const gpuwatch::app::MetricDatum* find(const std::vector<gpuwatch::app::MetricDatum>& v, const char* name) {
  for (const auto& d : v) if (d.name == name) return &d;
  return nullptr;
}

TEST(cloudwatch_maps_four_datums) {
  gpuwatch::model::MetricsRecord r{};
  r.temperature_c = 70; r.power_w = 250.5f; r.gpu_util_pct = 88;
  r.memory_total_gb = 80.0f; r.memory_used_gb = 12.5f;
  auto data = gpuwatch::app::to_metric_data(r, {"i-0abc", "p4d.24xlarge"}, 1);
  ASSERT_EQ(data.size(), 4u);

  const auto* usage = find(data, "GPU Usage");
  ASSERT_TRUE(usage != nullptr);
  ASSERT_TRUE(usage->unit == MetricUnit::Percent);
  ASSERT_EQ(usage->value, 88.0);

  const auto* mem = find(data, "Memory Used");
  ASSERT_TRUE(mem != nullptr);
  ASSERT_TRUE(mem->unit == MetricUnit::Gigabytes);
  ASSERT_EQ(mem->value, 12.5);

  const auto* temp = find(data, "Temperature (C)");
  ASSERT_TRUE(temp != nullptr);
  ASSERT_TRUE(temp->unit == MetricUnit::None);
  ASSERT_EQ(temp->value, 70.0);

  const auto* power = find(data, "Power (W)");
  ASSERT_TRUE(power != nullptr);
  ASSERT_EQ(power->value, 250.5);
}

TEST(cloudwatch_datums_carry_dimensions_and_resolution) {
  gpuwatch::model::MetricsRecord r{};
  auto data = gpuwatch::app::to_metric_data(r, {"i-0abc", "g5.xlarge"}, 60);
  for (const auto& d : data) {
    ASSERT_EQ(d.storage_resolution, 60);
    ASSERT_EQ(d.dimensions.size(), 2u);
    ASSERT_EQ(d.dimensions[0].name, std::string("InstanceId"));
    ASSERT_EQ(d.dimensions[0].value, std::string("i-0abc"));
    ASSERT_EQ(d.dimensions[1].name, std::string("InstanceType"));
    ASSERT_EQ(d.dimensions[1].value, std::string("g5.xlarge"));
  }
}

TEST(cloudwatch_sink_rejects_emit_before_open) {
  gpuwatch::app::CloudWatchOptions opts;
  opts.instance_id = "i-0abc";
  opts.instance_type = "g5.xlarge";
  gpuwatch::app::CloudWatchSink sink(opts);
  ASSERT_EQ(sink.instance().id, std::string("i-0abc"));
  std::string err;
  ASSERT_FALSE(sink.emit(gpuwatch::model::MetricsRecord{}, err));
  ASSERT_TRUE(!err.empty());
}
