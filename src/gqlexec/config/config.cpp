#include "gqlexec/config/config.hpp"
#include "gqlexec/config/toml_util.hpp"

#include "gqlexec/util/enum.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

namespace gqlexec {
namespace detail {

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct WatchToml {
  bool enabled{false};
  std::string directory{"./executors"};
};

struct ResolverToml {
  LoggingToml logging{};
  WatchToml watch{};
};

struct ExecutionToml {
  std::int64_t timeout_ms{30000};
  bool include_exception_details{false};
  int query_cache_size{100};
  bool instrumentation{true};
};

struct ExecutorToml {
  std::string name;
  ExecutionToml execution{};
};

} // namespace detail
} // namespace gqlexec

namespace glz {
template <> struct meta<gqlexec::detail::LoggingToml> {
  using T = gqlexec::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<gqlexec::detail::WatchToml> {
  using T = gqlexec::detail::WatchToml;
  static constexpr auto value =
      object("enabled", &T::enabled, "directory", &T::directory);
};

template <> struct meta<gqlexec::detail::ResolverToml> {
  using T = gqlexec::detail::ResolverToml;
  static constexpr auto value =
      object("logging", &T::logging, "watch", &T::watch);
};

template <> struct meta<gqlexec::detail::ExecutionToml> {
  using T = gqlexec::detail::ExecutionToml;
  static constexpr auto value =
      object("timeout_ms", &T::timeout_ms, "include_exception_details",
             &T::include_exception_details, "query_cache_size",
             &T::query_cache_size, "instrumentation", &T::instrumentation);
};

template <> struct meta<gqlexec::detail::ExecutorToml> {
  using T = gqlexec::detail::ExecutorToml;
  static constexpr auto value =
      object("name", &T::name, "execution", &T::execution);
};
} // namespace glz

namespace gqlexec {
namespace {

[[nodiscard]] auto env_flag(std::string_view v) -> bool {
  return v == "1" || v == "true";
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<ResolverConfig> {
  auto raw_result = toml_util::parse_toml<detail::ResolverToml>(toml_text);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  if (const char *v = std::getenv("GQLEXEC_LOG_LEVEL"); v != nullptr) {
    raw.logging.level = v;
  }
  if (const char *v = std::getenv("GQLEXEC_LOG_FILE"); v != nullptr) {
    raw.logging.file = v;
  }
  if (const char *v = std::getenv("GQLEXEC_WATCH_DIRECTORY"); v != nullptr) {
    raw.watch.directory = v;
  }
  if (const char *v = std::getenv("GQLEXEC_WATCH_ENABLED"); v != nullptr) {
    raw.watch.enabled = env_flag(v);
  }

  if (!util::is_enum_token<log::Level>(raw.logging.level)) {
    log::error("Unknown log level '{}'", raw.logging.level);
    return fail(Error::ParseError);
  }
  if (raw.watch.enabled && raw.watch.directory.empty()) {
    log::error("[watch] is enabled but no directory is set");
    return fail(Error::ParseError);
  }

  ResolverConfig cfg{};
  cfg.logging.level = parse<log::Level>(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);
  cfg.watch.enabled = raw.watch.enabled;
  cfg.watch.directory = std::move(raw.watch.directory);
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<ResolverConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<ResolverConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML resolver configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_executor_settings(const std::filesystem::path &path)
    -> Result<ExecutorSettings> {
  auto text = toml_util::read_file(path.string());
  if (!text) {
    return fail(text.error());
  }
  return parse_executor_settings(*text, path.stem().string());
}

auto ConfigLoader::parse_executor_settings(std::string_view toml_str,
                                           std::string_view default_name)
    -> Result<ExecutorSettings> {
  auto raw = toml_util::parse_toml<detail::ExecutorToml>(toml_str);
  if (!raw) {
    return fail(raw.error());
  }
  const auto &exec = raw->execution;
  if (exec.query_cache_size < 0) {
    log::error("query_cache_size must not be negative (got {})",
               exec.query_cache_size);
    return fail(Error::ParseError);
  }

  ExecutorSettings settings{};
  settings.name = resolve_name(ExecutorName{
      raw->name.empty() ? std::string(default_name) : std::move(raw->name)});
  settings.options.execution_timeout =
      std::chrono::milliseconds{exec.timeout_ms};
  settings.options.include_exception_details = exec.include_exception_details;
  settings.options.query_cache_size =
      static_cast<std::size_t>(exec.query_cache_size);
  settings.options.enable_instrumentation = exec.instrumentation;
  return ok(std::move(settings));
}

} // namespace gqlexec
