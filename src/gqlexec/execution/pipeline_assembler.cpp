#include "gqlexec/execution/pipeline_assembler.hpp"

#include "gqlexec/execution/default_pipeline.hpp"
#include "gqlexec/util/log.hpp"

#include <ranges>
#include <utility>

namespace gqlexec {

auto compose_pipeline(const ExecutorName &name,
                      const RequestPipeline &middleware,
                      std::shared_ptr<const ServiceProvider> services,
                      std::shared_ptr<const Activator> activator,
                      std::shared_ptr<const ErrorHandler> error_handler,
                      std::shared_ptr<const ExecutorOptions> options,
                      std::shared_ptr<IDiagnosticEvents> diagnostics)
    -> RequestDelegate {
  const RequestPipeline defaults =
      middleware.empty() ? default_pipeline() : RequestPipeline{};
  const auto &chain = middleware.empty() ? defaults : middleware;

  const MiddlewareFactoryContext factory{.executor_name = name,
                                         .services = std::move(services),
                                         .activator = std::move(activator),
                                         .error_handler =
                                             std::move(error_handler),
                                         .options = std::move(options),
                                         .diagnostics = std::move(diagnostics)};

  RequestDelegate next = [](RequestContext &) -> task<void> { co_return; };
  for (const auto &wrap : chain | std::views::reverse) {
    next = wrap(factory, std::move(next));
  }

  log::debug("Composed pipeline for {} ({} middleware{})", name, chain.size(),
             middleware.empty() ? ", default" : "");
  return next;
}

} // namespace gqlexec
