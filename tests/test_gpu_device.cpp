#include "minitest.hpp"
#include "FakeBackend.hpp"
#include "collectors/GpuDevice.hpp"
#include <string>

using gpuwatch::collectors::GpuDevice;
using gpuwatch::testing::FakeBackend;

TEST(gpu_device_open_resolves_identity) {
  FakeBackend be; be.count = 2;
  std::string err;
  auto dev = GpuDevice::open(be, 1, err);
  ASSERT_TRUE(dev != nullptr);
  ASSERT_EQ(dev->identity().index, 1);
  ASSERT_EQ(dev->identity().uuid, be.uuid);
  ASSERT_EQ(dev->identity().name, std::string("Fake GPU"));
  ASSERT_EQ(be.reads(), 0);
}

TEST(gpu_device_out_of_range_fails_before_any_query) {
  FakeBackend be; be.count = 1;
  std::string err;
  ASSERT_TRUE(GpuDevice::open(be, 1, err) == nullptr);
  ASSERT_TRUE(err.find("out of range") != std::string::npos);
  ASSERT_EQ(be.handle_calls, 0);
  ASSERT_EQ(be.uuid_calls, 0);
  ASSERT_EQ(be.reads(), 0);

  err.clear();
  ASSERT_TRUE(GpuDevice::open(be, -1, err) == nullptr);
  ASSERT_TRUE(err.find("out of range") != std::string::npos);
  ASSERT_EQ(be.handle_calls, 0);
}

TEST(gpu_device_no_devices_is_out_of_range) {
  FakeBackend be; be.count = 0;
  std::string err;
  ASSERT_TRUE(GpuDevice::open(be, 0, err) == nullptr);
  ASSERT_EQ(err, std::string("device index 0 out of range (0 devices)"));
}

TEST(gpu_device_count_failure_is_reported) {
  FakeBackend be; be.rc_count = 15;
  std::string err;
  ASSERT_TRUE(GpuDevice::open(be, 0, err) == nullptr);
  ASSERT_EQ(err, std::string("unable to get device count: GPU is lost"));
}

TEST(gpu_device_handle_and_uuid_failures) {
  FakeBackend be; be.rc_handle = 3;
  std::string err;
  ASSERT_TRUE(GpuDevice::open(be, 0, err) == nullptr);
  ASSERT_EQ(err, std::string("unable to get device at index 0: Not Supported"));

  FakeBackend be2; be2.rc_uuid = 3;
  err.clear();
  ASSERT_TRUE(GpuDevice::open(be2, 0, err) == nullptr);
  ASSERT_EQ(err, std::string("unable to get uuid of device at index 0: Not Supported"));
}

TEST(gpu_device_missing_name_is_not_fatal) {
  FakeBackend be; be.rc_name = 3;
  std::string err;
  auto dev = GpuDevice::open(be, 0, err);
  ASSERT_TRUE(dev != nullptr);
  ASSERT_TRUE(dev->identity().name.empty());
}

TEST(gpu_device_unit_conversion) {
  FakeBackend be;
  be.temp_c = 61;
  be.power_mw = 128000;
  be.mem_total = 24ull << 30;
  be.mem_used = 3ull << 29;   // 1.5 GiB
  be.util = 99;
  std::string err;
  auto dev = GpuDevice::open(be, 0, err);
  ASSERT_TRUE(dev != nullptr);

  gpuwatch::model::MetricsRecord rec{};
  ASSERT_TRUE(dev->read_metrics(rec, err));
  ASSERT_EQ(rec.temperature_c, 61u);
  ASSERT_EQ(rec.power_w, 128.0f);
  ASSERT_EQ(rec.gpu_util_pct, 99u);
  ASSERT_EQ(rec.memory_total_gb, 24.0f);
  ASSERT_EQ(rec.memory_used_gb, 1.5f);
}

TEST(gpu_device_fractional_power) {
  FakeBackend be; be.power_mw = 71234;
  std::string err;
  auto dev = GpuDevice::open(be, 0, err);
  float w = 0.0f;
  ASSERT_TRUE(dev->power(w, err));
  ASSERT_NEAR(w, 71.234, 1e-4);
}

TEST(gpu_device_single_read_failure_produces_no_record) {
  // One failing field at a time; the output record must stay untouched.
  for (int field = 0; field < 4; ++field) {
    FakeBackend be;
    std::string err;
    auto dev = GpuDevice::open(be, 0, err);
    ASSERT_TRUE(dev != nullptr);
    if (field == 0) be.rc_temp = 3;
    if (field == 1) be.rc_power = 3;
    if (field == 2) be.rc_mem = 3;
    if (field == 3) be.rc_util = 3;

    gpuwatch::model::MetricsRecord rec{};
    rec.temperature_c = 7; rec.power_w = 7.0f; rec.gpu_util_pct = 7;
    rec.memory_total_gb = 7.0f; rec.memory_used_gb = 7.0f;
    ASSERT_FALSE(dev->read_metrics(rec, err));
    ASSERT_TRUE(err.find("Not Supported") != std::string::npos);
    ASSERT_EQ(rec.temperature_c, 7u);
    ASSERT_EQ(rec.power_w, 7.0f);
    ASSERT_EQ(rec.gpu_util_pct, 7u);
    ASSERT_EQ(rec.memory_total_gb, 7.0f);
    ASSERT_EQ(rec.memory_used_gb, 7.0f);
  }
}

TEST(gpu_device_read_error_names_the_field) {
  FakeBackend be;
  std::string err;
  auto dev = GpuDevice::open(be, 0, err);
  be.rc_temp = 15;
  unsigned int t = 0;
  ASSERT_FALSE(dev->temperature(t, err));
  ASSERT_EQ(err, std::string("unable to read temperature: GPU is lost"));
}
