#pragma once

#include "gqlexec/util/enum.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/describe/enum.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace gqlexec::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };
BOOST_DESCRIBE_ENUM(Level, Trace, Debug, Info, Warn, Error)

} // namespace gqlexec::log

namespace gqlexec {
GQLEXEC_DEFINE_ENUM_SERDE(log::Level, log::Level::Info)
} // namespace gqlexec

namespace gqlexec::log {

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\033[90m", // trace: gray
    "\033[36m", // debug: cyan
    "\033[32m", // info: green
    "\033[33m", // warn: yellow
    "\033[31m"  // error: red
};

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

// Lines are formatted on the calling thread and handed to a writer thread
// through a bounded concurrent_channel. When the channel is full the line is
// written inline on a TTY and dropped otherwise.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex output_mu_;
  FILE *output_{stdout};
  FILE *file_{nullptr};

  boost::asio::io_context writer_ctx_{1};
  std::atomic<std::shared_ptr<LineChannel>> channel_;
  std::jthread writer_;

  auto write_lines(std::span<const std::string> lines) -> void {
    std::scoped_lock lock(output_mu_);
    for (const auto &line : lines) {
      std::fwrite(line.data(), 1, line.size(), output_);
    }
    std::fflush(output_);
  }

  auto writer_loop(std::shared_ptr<LineChannel> channel) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    auto drain = [&] {
      while (batch.size() < kBatchSize &&
             channel->try_receive(
                 [&](boost::system::error_code ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
    };

    while (running_.load(std::memory_order_acquire)) {
      boost::system::error_code recv_ec;
      channel->async_receive(
          [&](boost::system::error_code ec, std::string line) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(line));
            }
          });
      writer_ctx_.restart();
      (void)writer_ctx_.run_one();
      if (recv_ec) {
        break;
      }
      drain();
      write_lines(batch);
      batch.clear();
    }

    // Flush whatever was queued before stop().
    for (;;) {
      drain();
      if (batch.empty()) {
        break;
      }
      write_lines(batch);
      batch.clear();
    }
  }

  [[nodiscard]] auto attached_to_tty() -> bool {
    std::scoped_lock lock(output_mu_);
    const int fd = ::fileno(output_);
    return fd >= 0 && ::isatty(fd) != 0;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    writer_ctx_.restart();
    auto channel = std::make_shared<LineChannel>(writer_ctx_.get_executor(),
                                                 kQueueCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel = std::move(channel)] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(output_mu_);
    output_ = stderr;
  }

  /// Append to `path`; an empty path restores stdout.
  auto set_output_file(std::string_view path) -> bool {
    std::scoped_lock lock(output_mu_);
    if (path.empty()) {
      output_ = stdout;
      if (file_ != nullptr) {
        std::fclose(std::exchange(file_, nullptr));
      }
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_ != nullptr) {
      std::fclose(file_);
    }
    file_ = f;
    output_ = f;
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    std::string line;
    line.reserve(256);
    std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                   now, level_color(level), to_string_view(level), "\033[0m",
                   tid);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    auto channel = channel_.load(std::memory_order_acquire);
    if (channel && channel->try_send(boost::system::error_code{}, line)) {
      return;
    }
    if (channel && !attached_to_tty()) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    write_lines(std::span<const std::string>(&line, 1));
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse<Level>(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace gqlexec::log
