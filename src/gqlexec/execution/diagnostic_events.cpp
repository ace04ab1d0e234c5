#include "gqlexec/execution/diagnostic_events.hpp"

#include "gqlexec/execution/request_context.hpp"
#include "gqlexec/execution/request_executor.hpp"
#include "gqlexec/schema/schema.hpp"
#include "gqlexec/util/log.hpp"

namespace gqlexec {

auto LoggingDiagnosticEvents::executor_created(const ExecutorName &name,
                                               const RequestExecutor &executor)
    -> void {
  log::info("Executor created: {} ({} types)", name,
            executor.schema().types().size());
}

auto LoggingDiagnosticEvents::executor_evicted(
    const ExecutorName &name, const RequestExecutor & /*executor*/) -> void {
  log::info("Executor evicted: {}", name);
}

auto LoggingDiagnosticEvents::request_started(const RequestContext &context)
    -> void {
  log::trace("Request started on {}: operation='{}'", context.executor_name,
             context.request.operation_name);
}

auto LoggingDiagnosticEvents::request_finished(
    const RequestContext &context, std::chrono::nanoseconds elapsed) -> void {
  log::debug("Request finished on {} in {}us ({} errors)",
             context.executor_name,
             std::chrono::duration_cast<std::chrono::microseconds>(elapsed)
                 .count(),
             context.errors.size());
}

} // namespace gqlexec
