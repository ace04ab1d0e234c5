#pragma once

#include <chrono>
#include <cstddef>

namespace gqlexec {

// Per-executor settings resolved from the base options plus every configure
// action registered for the executor name.
struct ExecutorOptions {
  std::chrono::milliseconds execution_timeout{std::chrono::seconds(30)};
  bool include_exception_details{false};
  std::size_t query_cache_size{100};
  bool enable_instrumentation{true};

  auto operator==(const ExecutorOptions &) const -> bool = default;
};

} // namespace gqlexec
