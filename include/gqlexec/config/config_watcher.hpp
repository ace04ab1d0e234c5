#pragma once

#include "gqlexec/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

namespace gqlexec {

using FileChangeCallback =
    std::move_only_function<void(const std::filesystem::path &)>;
using FileRemoveCallback =
    std::move_only_function<void(const std::filesystem::path &)>;

// Reports created, rewritten and removed `.toml` files in one directory.
// Callbacks run on `executor`. Once stop() returns no callback is running and
// none will be invoked again.
class ConfigWatcher {
public:
  ConfigWatcher(boost::asio::any_io_executor executor,
                std::filesystem::path directory);
  ~ConfigWatcher();

  ConfigWatcher(const ConfigWatcher &) = delete;
  auto operator=(const ConfigWatcher &) -> ConfigWatcher & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  /// Must be set before start().
  auto set_on_file_changed(FileChangeCallback cb) -> void;
  auto set_on_file_removed(FileRemoveCallback cb) -> void;

  [[nodiscard]] auto directory() const -> const std::filesystem::path &;

  [[nodiscard]] static auto is_transient_file(std::string_view name) -> bool;

private:
  struct WatchState;
  static auto process_events(WatchState &state, const char *buf,
                             std::size_t len) -> void;

  boost::asio::any_io_executor executor_;
  std::filesystem::path directory_;
  std::atomic<bool> running_{false};
  std::shared_ptr<WatchState> watch_state_;

  FileChangeCallback on_file_changed_;
  FileRemoveCallback on_file_removed_;
};

} // namespace gqlexec
