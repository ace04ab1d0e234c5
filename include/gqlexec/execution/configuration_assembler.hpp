#pragma once

#include "gqlexec/config/configure_action.hpp"
#include "gqlexec/config/executor_options.hpp"
#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/core/error.hpp"

#include <optional>

namespace gqlexec {

/// Starts from `base` (or defaults) and applies `actions` in order. Later
/// actions overwrite earlier ones. The first failing action's error is
/// returned unchanged; Error::Cancelled when cancelled between actions.
[[nodiscard]] auto
resolve_executor_options(const std::optional<ExecutorOptions> &base,
                         const ConfigureActions<ExecutorOptions> &actions)
    -> task<Result<ExecutorOptions>>;

} // namespace gqlexec
