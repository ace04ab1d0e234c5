#include "gqlexec/config/config_watcher.hpp"

#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <mutex>
#include <utility>

namespace gqlexec {
namespace {

constexpr std::size_t kEventBufferSize = 4096;

} // namespace

struct ConfigWatcher::WatchState {
  std::filesystem::path directory;
  std::atomic<bool> running{false};
  // Held while a callback runs so stop() can wait for it.
  std::mutex callback_mu;
  FileChangeCallback on_file_changed;
  FileRemoveCallback on_file_removed;

  std::unique_ptr<boost::asio::posix::stream_descriptor> inotify_stream;
};

ConfigWatcher::ConfigWatcher(boost::asio::any_io_executor executor,
                             std::filesystem::path directory)
    : executor_(std::move(executor)), directory_(std::move(directory)) {}

ConfigWatcher::~ConfigWatcher() { stop(); }

auto ConfigWatcher::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  auto state = std::make_shared<WatchState>();
  state->directory = directory_;
  state->on_file_changed = std::move(on_file_changed_);
  state->on_file_removed = std::move(on_file_removed_);

  auto fd = sys_check(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!fd) {
    log::error("Failed to initialize inotify: {}", fd.error().message());
    running_.store(false);
    return fail(fd.error());
  }

  auto wd = sys_check(inotify_add_watch(
      *fd, state->directory.c_str(),
      IN_CREATE | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO));
  if (!wd) {
    log::error("Failed to add watch on {}: {}", state->directory.string(),
               wd.error().message());
    ::close(*fd);
    running_.store(false);
    return fail(wd.error());
  }

  // The stream owns the descriptor from here on.
  state->inotify_stream =
      std::make_unique<boost::asio::posix::stream_descriptor>(executor_, *fd);
  state->running.store(true, std::memory_order_release);
  watch_state_ = state;

  boost::asio::co_spawn(
      executor_,
      [state]() -> task<void> {
        std::array<char, kEventBufferSize> buffer{};
        while (state->running.load(std::memory_order_acquire)) {
          boost::system::error_code ec;
          auto bytes_read = co_await state->inotify_stream->async_read_some(
              boost::asio::buffer(buffer),
              boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          if (ec == boost::asio::error::operation_aborted) {
            break;
          }
          if (ec) {
            if (ec != boost::asio::error::bad_descriptor) {
              log::warn("ConfigWatcher read error: {}", ec.message());
            }
            break;
          }
          if (bytes_read > 0) {
            process_events(*state, buffer.data(), bytes_read);
          }
        }
      },
      boost::asio::detached);

  log::info("ConfigWatcher started for {}", directory_.string());
  return ok();
}

auto ConfigWatcher::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  auto state = std::move(watch_state_);
  if (!state) {
    return;
  }

  {
    std::scoped_lock lock(state->callback_mu);
    state->running.store(false, std::memory_order_release);
  }

  // The read loop and the descriptor live on the executor; close them there.
  boost::asio::post(executor_, [state]() {
    if (state->inotify_stream) {
      boost::system::error_code ec;
      state->inotify_stream->cancel(ec);
      state->inotify_stream->close(ec);
    }
  });
  log::info("ConfigWatcher stopped for {}", directory_.string());
}

auto ConfigWatcher::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto ConfigWatcher::set_on_file_changed(FileChangeCallback cb) -> void {
  on_file_changed_ = std::move(cb);
}

auto ConfigWatcher::set_on_file_removed(FileRemoveCallback cb) -> void {
  on_file_removed_ = std::move(cb);
}

auto ConfigWatcher::directory() const -> const std::filesystem::path & {
  return directory_;
}

auto ConfigWatcher::is_transient_file(std::string_view name) -> bool {
  if (name.empty() || name == "." || name == "..") {
    return true;
  }
  if (name.ends_with("~")) {
    return true;
  }

  constexpr std::array<std::string_view, 7> kTransientSuffixes{
      ".swp", ".swo", ".swx", ".tmp", ".temp", ".bak", ".part"};
  for (auto suffix : kTransientSuffixes) {
    if (name.ends_with(suffix)) {
      return true;
    }
  }

  // Exact check so "api_backup.swp.toml" is still reported.
  return name.starts_with('.') && !name.ends_with(".toml");
}

auto ConfigWatcher::process_events(WatchState &state, const char *buf,
                                   std::size_t len) -> void {
  std::size_t i = 0;
  while (i < len) {
    const auto *event = reinterpret_cast<const inotify_event *>(buf + i);
    i += sizeof(inotify_event) + event->len;

    if (event->len == 0 || is_transient_file(event->name)) {
      continue;
    }
    std::filesystem::path file_path = state.directory / event->name;
    if (file_path.extension() != ".toml") {
      continue;
    }

    std::scoped_lock lock(state.callback_mu);
    if (!state.running.load(std::memory_order_acquire)) {
      return;
    }
    if ((event->mask & (IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO)) != 0) {
      log::info("File changed: {}", file_path.string());
      if (state.on_file_changed) {
        state.on_file_changed(file_path);
      }
    } else if ((event->mask & (IN_DELETE | IN_MOVED_FROM)) != 0) {
      log::info("File removed: {}", file_path.string());
      if (state.on_file_removed) {
        state.on_file_removed(file_path);
      }
    }
  }
}

} // namespace gqlexec
