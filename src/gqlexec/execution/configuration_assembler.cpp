#include "gqlexec/execution/configuration_assembler.hpp"

#include "gqlexec/core/asio_awaitable.hpp"

namespace gqlexec {

auto resolve_executor_options(const std::optional<ExecutorOptions> &base,
                              const ConfigureActions<ExecutorOptions> &actions)
    -> task<Result<ExecutorOptions>> {
  ExecutorOptions options = base.value_or(ExecutorOptions{});

  if (auto cancelled = co_await check_cancelled(); !cancelled) {
    co_return fail(cancelled.error());
  }
  if (auto applied = co_await apply_actions(actions, options); !applied) {
    co_return fail(applied.error());
  }
  co_return ok(std::move(options));
}

} // namespace gqlexec
