#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("gpuwatch_test_toml_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  gpuwatch::util::TomlReader tr;
  ASSERT_FALSE(tr.load(tmp_path("nonexistent")));
}

TEST(toml_load_sections) {
  auto path = tmp_path("basic");
  write_file(path,
    "# exporter settings\n"
    "[device]\n"
    "index = 1\n"
    "\n"
    "[ cloudwatch ]\n"
    "namespace = \"Fleet/GPU\"\n"
    "storage_resolution = 60\n");
  gpuwatch::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("device", "index"), 1);
  ASSERT_EQ(tr.get_string("cloudwatch", "namespace"), "Fleet/GPU");
  ASSERT_EQ(tr.get_int("cloudwatch", "storage_resolution"), 60);
  ASSERT_TRUE(tr.has("cloudwatch", "namespace"));
  ASSERT_FALSE(tr.has("cloudwatch", "region"));
  ASSERT_FALSE(tr.has("nosection", "index"));
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[log]\nverbose = true\n");
  gpuwatch::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("log", "missing", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("log", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("log", "missing_bool", true), true);
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  remove_file(path);
}

TEST(toml_trailing_comments) {
  auto path = tmp_path("comments");
  write_file(path,
    "[sampling]\n"
    "interval_ms = 2500   # every 2.5s\n"
    "[output]\n"
    "sink = stdout # bare string\n"
    "tag = \"#gpu # not a comment\"  # a comment\n");
  gpuwatch::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_ms"), 2500);
  ASSERT_EQ(tr.get_string("output", "sink"), "stdout");
  ASSERT_EQ(tr.get_string("output", "tag"), "#gpu # not a comment");
  remove_file(path);
}

TEST(toml_int_coercion) {
  auto path = tmp_path("int");
  write_file(path,
    "[n]\n"
    "neg = -7\n"
    "str = hello\n"
    "partial = 12ms\n");
  gpuwatch::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  ASSERT_EQ(tr.get_int("n", "partial", 99), 99);
  remove_file(path);
}

TEST(toml_bool_variants) {
  auto path = tmp_path("bool");
  write_file(path, "[b]\na = true\nb = TRUE\nc = 0\nd = False\ne = junk\n");
  gpuwatch::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b"), true);
  ASSERT_EQ(tr.get_bool("b", "c", true), false);
  ASSERT_EQ(tr.get_bool("b", "d", true), false);
  ASSERT_EQ(tr.get_bool("b", "e", true), true);
  remove_file(path);
}

TEST(toml_global_keys_and_reload) {
  auto path = tmp_path("global");
  write_file(path, "key = value\n[sec]\nother = 1\n");
  gpuwatch::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);

  write_file(path, "[sec]\nother = 2\n");
  ASSERT_TRUE(tr.load(path));
  ASSERT_FALSE(tr.has("", "key"));
  ASSERT_EQ(tr.get_int("sec", "other"), 2);
  remove_file(path);
}
