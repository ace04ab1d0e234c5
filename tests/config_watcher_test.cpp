#include "gqlexec/config/config_watcher.hpp"

#include "test_utils.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>

#include "gtest/gtest.h"

using namespace gqlexec;
namespace fs = std::filesystem;

class ConfigWatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
    io_thread_ = std::thread([this] { io_.run(); });
  }

  void TearDown() override {
    work_.reset();
    io_.stop();
    io_thread_.join();
  }

  auto create_toml_file(const std::string &name,
                        const std::string &content = "name = \"test\"")
      -> fs::path {
    auto path = dir_.path() / name;
    test::write_file(path, content);
    return path;
  }

  auto wait_for(std::atomic<int> &counter, int expected) -> bool {
    return test::poll_until([&] { return counter.load() >= expected; },
                            std::chrono::seconds(5));
  }

  test::TempDir dir_{"gqlexec_watcher_test_"};
  boost::asio::io_context io_;
  std::optional<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_{io_.get_executor()};
  std::thread io_thread_;
};

TEST_F(ConfigWatcherTest, ConstructorSetsDirectory) {
  ConfigWatcher watcher(io_.get_executor(), dir_.path());
  EXPECT_EQ(watcher.directory(), dir_.path());
  EXPECT_FALSE(watcher.is_running());
}

TEST_F(ConfigWatcherTest, StartAndStopAreIdempotent) {
  ConfigWatcher watcher(io_.get_executor(), dir_.path());

  ASSERT_TRUE(watcher.start().has_value());
  EXPECT_TRUE(watcher.start().has_value());
  EXPECT_TRUE(watcher.is_running());

  watcher.stop();
  watcher.stop();
  EXPECT_FALSE(watcher.is_running());
}

TEST_F(ConfigWatcherTest, MissingDirectoryFailsToStart) {
  ConfigWatcher watcher(io_.get_executor(), dir_.path() / "missing");

  auto started = watcher.start();

  EXPECT_FALSE(started.has_value());
  EXPECT_FALSE(watcher.is_running());
}

TEST_F(ConfigWatcherTest, ReportsWrittenAndRemovedTomlFiles) {
  std::atomic<int> changes{0};
  std::atomic<int> removals{0};
  std::mutex mu;
  fs::path last_changed;
  fs::path last_removed;

  ConfigWatcher watcher(io_.get_executor(), dir_.path());
  watcher.set_on_file_changed([&](const fs::path &path) {
    {
      std::scoped_lock lock(mu);
      last_changed = path;
    }
    changes.fetch_add(1);
  });
  watcher.set_on_file_removed([&](const fs::path &path) {
    {
      std::scoped_lock lock(mu);
      last_removed = path;
    }
    removals.fetch_add(1);
  });
  ASSERT_TRUE(watcher.start().has_value());

  auto file = create_toml_file("catalog.toml");
  ASSERT_TRUE(wait_for(changes, 1));
  {
    std::scoped_lock lock(mu);
    EXPECT_EQ(last_changed, file);
  }

  fs::remove(file);
  ASSERT_TRUE(wait_for(removals, 1));
  std::scoped_lock lock(mu);
  EXPECT_EQ(last_removed, file);
}

TEST_F(ConfigWatcherTest, IgnoresOtherExtensionsAndEditorFiles) {
  std::atomic<int> changes{0};
  ConfigWatcher watcher(io_.get_executor(), dir_.path());
  watcher.set_on_file_changed([&](const fs::path &) { changes.fetch_add(1); });
  ASSERT_TRUE(watcher.start().has_value());

  create_toml_file("notes.txt");
  create_toml_file("catalog.toml.swp");
  create_toml_file("catalog.toml~");
  create_toml_file("marker.toml");

  ASSERT_TRUE(wait_for(changes, 1));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  // marker.toml triggers create and close-write notifications only.
  EXPECT_LE(changes.load(), 2);
}

TEST_F(ConfigWatcherTest, NoCallbacksAfterStop) {
  std::atomic<int> changes{0};
  ConfigWatcher watcher(io_.get_executor(), dir_.path());
  watcher.set_on_file_changed([&](const fs::path &) { changes.fetch_add(1); });
  ASSERT_TRUE(watcher.start().has_value());
  watcher.stop();

  create_toml_file("late.toml");
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  EXPECT_EQ(changes.load(), 0);
}

TEST(ConfigWatcherTransientTest, ClassifiesEditorArtifacts) {
  EXPECT_TRUE(ConfigWatcher::is_transient_file(""));
  EXPECT_TRUE(ConfigWatcher::is_transient_file(".catalog.toml.swp"));
  EXPECT_TRUE(ConfigWatcher::is_transient_file("catalog.toml~"));
  EXPECT_TRUE(ConfigWatcher::is_transient_file(".hidden"));
  EXPECT_FALSE(ConfigWatcher::is_transient_file("catalog.toml"));
  EXPECT_FALSE(ConfigWatcher::is_transient_file(".catalog.toml"));
  EXPECT_FALSE(ConfigWatcher::is_transient_file("api_backup.swp.toml"));
}
