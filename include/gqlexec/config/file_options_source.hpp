#pragma once

#include "gqlexec/config/config.hpp"
#include "gqlexec/config/config_watcher.hpp"
#include "gqlexec/config/options_source.hpp"
#include "gqlexec/core/error.hpp"
#include "gqlexec/util/id.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace gqlexec {

struct ScannedFile {
  std::filesystem::path path;
  Result<ExecutorSettings> settings;
};

// Keeps the base ExecutorOptions in a FactoryOptionsStore in sync with the
// `<name>.toml` files of one directory. Every applied change goes through the
// store, so registry listeners evict the affected executor.
class FileOptionsSource {
public:
  FileOptionsSource(boost::asio::any_io_executor executor,
                    std::filesystem::path directory,
                    std::shared_ptr<FactoryOptionsStore> store);
  ~FileOptionsSource();

  FileOptionsSource(const FileOptionsSource &) = delete;
  auto operator=(const FileOptionsSource &) -> FileOptionsSource & = delete;

  /// Loads every file currently present, then watches for changes.
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;

  /// Loads every `.toml` file in the directory; returns how many applied.
  auto scan() -> std::size_t;

  [[nodiscard]] auto load_file(const std::filesystem::path &path)
      -> Result<ExecutorName>;
  auto remove_file(const std::filesystem::path &path) -> void;

  [[nodiscard]] auto names() const -> std::vector<ExecutorName>;
  [[nodiscard]] auto directory() const -> const std::filesystem::path & {
    return directory_;
  }

  /// Parses every `.toml` file of `directory` in path order without applying
  /// anything.
  [[nodiscard]] static auto scan_directory(const std::filesystem::path &directory)
      -> Result<std::vector<ScannedFile>>;

private:
  auto clear_options(const ExecutorName &name) -> void;

  std::filesystem::path directory_;
  std::shared_ptr<FactoryOptionsStore> store_;
  ConfigWatcher watcher_;

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<std::string, ExecutorName> file_names_;
};

} // namespace gqlexec
