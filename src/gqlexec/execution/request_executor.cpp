#include "gqlexec/execution/request_executor.hpp"

#include "gqlexec/execution/error_handler.hpp"
#include "gqlexec/schema/schema.hpp"

#include <utility>

namespace gqlexec {

RequestExecutor::RequestExecutor(RequestExecutorParts parts)
    : parts_(std::move(parts)) {}

auto RequestExecutor::execute(Request request) const -> task<Response> {
  // Pin this executor for the duration of the request; the registry may drop
  // its reference mid-flight.
  auto self = shared_from_this();

  RequestContext context{.executor_name = parts_.name,
                         .schema = parts_.schema,
                         .services = parts_.services,
                         .error_handler = parts_.error_handler,
                         .request = std::move(request)};
  co_await parts_.pipeline(context);

  co_return Response{.data = std::move(context.result),
                     .errors = std::move(context.errors)};
}

} // namespace gqlexec
