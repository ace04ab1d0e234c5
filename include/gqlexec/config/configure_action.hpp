#pragma once

#include "gqlexec/core/asio_awaitable.hpp"
#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/core/error.hpp"

#include <functional>
#include <utility>
#include <variant>
#include <vector>

namespace gqlexec {

template <typename Target>
using SyncConfigure = std::function<Result<void>(Target &)>;

template <typename Target>
using AsyncConfigure = std::function<task<Result<void>>(Target &)>;

template <typename Target> struct SyncAction {
  SyncConfigure<Target> configure;
};

template <typename Target> struct AsyncAction {
  AsyncConfigure<Target> configure;
};

/// Runs `configure` first, then awaits `configure_async`.
template <typename Target> struct CombinedAction {
  SyncConfigure<Target> configure;
  AsyncConfigure<Target> configure_async;
};

template <typename Target>
using ConfigureAction = std::variant<SyncAction<Target>, AsyncAction<Target>,
                                     CombinedAction<Target>>;

template <typename Target>
using ConfigureActions = std::vector<ConfigureAction<Target>>;

template <typename Target>
[[nodiscard]] auto sync_action(SyncConfigure<Target> configure)
    -> ConfigureAction<Target> {
  return SyncAction<Target>{std::move(configure)};
}

template <typename Target>
[[nodiscard]] auto async_action(AsyncConfigure<Target> configure)
    -> ConfigureAction<Target> {
  return AsyncAction<Target>{std::move(configure)};
}

template <typename Target>
[[nodiscard]] auto combined_action(SyncConfigure<Target> configure,
                                   AsyncConfigure<Target> configure_async)
    -> ConfigureAction<Target> {
  return CombinedAction<Target>{std::move(configure),
                                std::move(configure_async)};
}

namespace detail {

template <typename Target>
auto run_sync(const SyncConfigure<Target> &fn, Target &target) -> Result<void> {
  return fn ? fn(target) : ok();
}

template <typename Target>
auto run_async(const AsyncConfigure<Target> &fn, Target &target)
    -> task<Result<void>> {
  if (!fn) {
    co_return ok();
  }
  co_return co_await fn(target);
}

} // namespace detail

/// Applies one action of any shape, completing its asynchronous part before
/// returning. Every action is a potential suspension point, so cancellation
/// is checked once the action has finished.
template <typename Target>
auto apply_action(const ConfigureAction<Target> &action, Target &target)
    -> task<Result<void>> {
  Result<void> result = ok();
  if (const auto *sync = std::get_if<SyncAction<Target>>(&action)) {
    result = detail::run_sync(sync->configure, target);
  } else if (const auto *async = std::get_if<AsyncAction<Target>>(&action)) {
    result = co_await detail::run_async(async->configure, target);
  } else {
    const auto &both = std::get<CombinedAction<Target>>(action);
    result = detail::run_sync(both.configure, target);
    if (result) {
      result = co_await detail::run_async(both.configure_async, target);
    }
  }
  if (!result) {
    co_return result;
  }
  co_return co_await check_cancelled();
}

/// Applies `actions` in order; the first failure stops the sequence.
template <typename Target>
auto apply_actions(const ConfigureActions<Target> &actions, Target &target)
    -> task<Result<void>> {
  for (const auto &action : actions) {
    if (auto applied = co_await apply_action(action, target); !applied) {
      co_return applied;
    }
  }
  co_return ok();
}

} // namespace gqlexec
