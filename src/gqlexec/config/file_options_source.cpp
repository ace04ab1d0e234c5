#include "gqlexec/config/file_options_source.hpp"

#include "gqlexec/util/log.hpp"

#include <algorithm>
#include <optional>
#include <system_error>

namespace gqlexec {

FileOptionsSource::FileOptionsSource(boost::asio::any_io_executor executor,
                                     std::filesystem::path directory,
                                     std::shared_ptr<FactoryOptionsStore> store)
    : directory_(std::move(directory)), store_(std::move(store)),
      watcher_(std::move(executor), directory_) {
  watcher_.set_on_file_changed([this](const std::filesystem::path &path) {
    if (auto loaded = load_file(path); !loaded) {
      log::warn("Keeping previous options for {}: {}", path.string(),
                loaded.error().message());
    }
  });
  watcher_.set_on_file_removed(
      [this](const std::filesystem::path &path) { remove_file(path); });
}

FileOptionsSource::~FileOptionsSource() { stop(); }

auto FileOptionsSource::start() -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    log::error("Watch directory {} does not exist", directory_.string());
    return fail(Error::FileNotFound);
  }
  auto loaded = scan();
  log::info("Loaded {} executor configuration(s) from {}", loaded,
            directory_.string());
  return watcher_.start();
}

auto FileOptionsSource::stop() noexcept -> void { watcher_.stop(); }

auto FileOptionsSource::scan_directory(const std::filesystem::path &directory)
    -> Result<std::vector<ScannedFile>> {
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    return fail(Error::FileNotFound);
  }

  std::vector<std::filesystem::path> paths;
  for (const auto &entry : it) {
    const auto &path = entry.path();
    if (entry.is_regular_file(ec) && path.extension() == ".toml" &&
        !ConfigWatcher::is_transient_file(path.filename().string())) {
      paths.push_back(path);
    }
  }
  std::ranges::sort(paths);

  std::vector<ScannedFile> files;
  files.reserve(paths.size());
  for (auto &path : paths) {
    auto settings = ConfigLoader::load_executor_settings(path);
    files.push_back(ScannedFile{.path = std::move(path),
                                .settings = std::move(settings)});
  }
  return ok(std::move(files));
}

auto FileOptionsSource::scan() -> std::size_t {
  auto files = scan_directory(directory_);
  if (!files) {
    log::warn("Cannot scan {}: {}", directory_.string(),
              files.error().message());
    return 0;
  }
  std::size_t applied = 0;
  for (const auto &file : *files) {
    if (auto loaded = load_file(file.path); loaded) {
      ++applied;
    } else {
      log::warn("Skipping {}: {}", file.path.string(),
                loaded.error().message());
    }
  }
  return applied;
}

auto FileOptionsSource::load_file(const std::filesystem::path &path)
    -> Result<ExecutorName> {
  auto settings = ConfigLoader::load_executor_settings(path);
  if (!settings) {
    return fail(settings.error());
  }

  std::optional<ExecutorName> previous;
  {
    std::scoped_lock lock(mu_);
    auto [it, inserted] = file_names_.try_emplace(path.string(), settings->name);
    if (!inserted && it->second != settings->name) {
      previous = std::exchange(it->second, settings->name);
    }
  }
  if (previous) {
    clear_options(*previous);
  }

  store_->configure(settings->name, [&](FactoryOptions &options) {
    options.executor_options = settings->options;
  });
  log::debug("Applied {} to executor {}", path.string(), settings->name);
  return ok(std::move(settings->name));
}

auto FileOptionsSource::remove_file(const std::filesystem::path &path)
    -> void {
  std::optional<ExecutorName> name;
  {
    std::scoped_lock lock(mu_);
    if (auto it = file_names_.find(path.string()); it != file_names_.end()) {
      name = std::move(it->second);
      file_names_.erase(it);
    }
  }
  if (name) {
    clear_options(*name);
  }
}

auto FileOptionsSource::clear_options(const ExecutorName &name) -> void {
  store_->configure(name, [](FactoryOptions &options) {
    options.executor_options.reset();
  });
  log::info("Cleared file options of executor {}", name);
}

auto FileOptionsSource::names() const -> std::vector<ExecutorName> {
  std::scoped_lock lock(mu_);
  std::vector<ExecutorName> out;
  out.reserve(file_names_.size());
  for (const auto &[path, name] : file_names_) {
    out.push_back(name);
  }
  std::ranges::sort(out);
  return out;
}

} // namespace gqlexec
