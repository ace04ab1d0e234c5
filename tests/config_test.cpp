#include "gqlexec/config/config.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

#include "gtest/gtest.h"

using namespace gqlexec;
using namespace std::chrono_literals;

namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
};

} // namespace

TEST(ConfigTest, ResolverDefaults) {
  ResolverConfig cfg;
  EXPECT_EQ(cfg.logging.level, log::Level::Info);
  EXPECT_TRUE(cfg.logging.file.empty());
  EXPECT_FALSE(cfg.watch.enabled);
  EXPECT_EQ(cfg.watch.directory, "./executors");
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[logging]
level = "debug"
file = "/var/log/gqlexec.log"

[watch]
enabled = true
directory = "/etc/gqlexec/executors"
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->logging.level, log::Level::Debug);
  EXPECT_EQ(result->logging.file, "/var/log/gqlexec.log");
  EXPECT_TRUE(result->watch.enabled);
  EXPECT_EQ(result->watch.directory, "/etc/gqlexec/executors");
}

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, log::Level::Info);
  EXPECT_FALSE(result->watch.enabled);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "warn"
color = true

[server]
port = 8080
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, log::Level::Warn);
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
  auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "verbose"
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsEnabledWatchWithoutDirectory) {
  auto result = ConfigLoader::load_from_string(R"(
[watch]
enabled = true
directory = ""
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsMalformedToml) {
  auto result = ConfigLoader::load_from_string("[logging\nlevel = ");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv level("GQLEXEC_LOG_LEVEL", "error");
  ScopedEnv directory("GQLEXEC_WATCH_DIRECTORY", "/srv/executors");
  ScopedEnv enabled("GQLEXEC_WATCH_ENABLED", "1");

  auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[watch]
enabled = false
directory = "./local"
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, log::Level::Error);
  EXPECT_TRUE(result->watch.enabled);
  EXPECT_EQ(result->watch.directory, "/srv/executors");
}

TEST(ConfigTest, MissingFileIsReported) {
  auto result = ConfigLoader::load_from_file("/nonexistent/gqlexec.toml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, ExecutorSettingsFromToml) {
  auto settings = ConfigLoader::parse_executor_settings(R"(
name = "catalog"

[execution]
timeout_ms = 1500
include_exception_details = true
query_cache_size = 250
instrumentation = false
)",
                                                        "ignored");
  ASSERT_TRUE(settings.has_value()) << settings.error().message();

  EXPECT_EQ(settings->name, ExecutorName{"catalog"});
  EXPECT_EQ(settings->options.execution_timeout, 1500ms);
  EXPECT_TRUE(settings->options.include_exception_details);
  EXPECT_EQ(settings->options.query_cache_size, 250u);
  EXPECT_FALSE(settings->options.enable_instrumentation);
}

TEST(ConfigTest, ExecutorNameDefaultsToFileStem) {
  test::TempDir dir;
  auto path = dir.path() / "inventory.toml";
  test::write_file(path, "[execution]\ntimeout_ms = 0\n");

  auto settings = ConfigLoader::load_executor_settings(path);
  ASSERT_TRUE(settings.has_value());

  EXPECT_EQ(settings->name, ExecutorName{"inventory"});
  EXPECT_EQ(settings->options.execution_timeout, 0ms);
  EXPECT_EQ(settings->options.query_cache_size, ExecutorOptions{}.query_cache_size);
}

TEST(ConfigTest, ExecutorSettingsRejectNegativeCacheSize) {
  auto settings = ConfigLoader::parse_executor_settings(
      "[execution]\nquery_cache_size = -1\n", "catalog");
  ASSERT_FALSE(settings.has_value());
  EXPECT_EQ(settings.error(), make_error_code(Error::ParseError));
}
