#include "gqlexec/execution/default_pipeline.hpp"

#include "gqlexec/config/executor_options.hpp"
#include "gqlexec/core/asio_awaitable.hpp"
#include "gqlexec/execution/activator.hpp"
#include "gqlexec/execution/diagnostic_events.hpp"
#include "gqlexec/execution/error_handler.hpp"
#include "gqlexec/execution/operation_executor.hpp"
#include "gqlexec/execution/request_context.hpp"

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <utility>

namespace gqlexec {

auto use_instrumentation() -> RequestMiddleware {
  return [](const MiddlewareFactoryContext &factory,
            RequestDelegate next) -> RequestDelegate {
    if (!factory.diagnostics || !factory.options->enable_instrumentation) {
      return next;
    }
    return [diagnostics = factory.diagnostics,
            next = std::move(next)](RequestContext &context) -> task<void> {
      diagnostics->request_started(context);
      auto started = std::chrono::steady_clock::now();
      co_await next(context);
      diagnostics->request_finished(context,
                                    std::chrono::steady_clock::now() - started);
    };
  };
}

auto use_exception_handling() -> RequestMiddleware {
  return [](const MiddlewareFactoryContext &factory,
            RequestDelegate next) -> RequestDelegate {
    return [error_handler = factory.error_handler,
            next = std::move(next)](RequestContext &context) -> task<void> {
      try {
        co_await next(context);
      } catch (const std::exception &ex) {
        context.add_error(error_handler->create_unexpected_error(ex));
      }
    };
  };
}

auto use_request_timeout() -> RequestMiddleware {
  return [](const MiddlewareFactoryContext &factory,
            RequestDelegate next) -> RequestDelegate {
    auto timeout = factory.options->execution_timeout;
    if (timeout <= std::chrono::milliseconds::zero()) {
      return next;
    }
    return [timeout,
            next = std::move(next)](RequestContext &context) -> task<void> {
      using namespace awaitable_ops;
      boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                      timeout);
      auto outcome = co_await (next(context) || timer.async_wait(use_nothrow));
      if (outcome.index() == 1) {
        context.add_error(make_error_code(Error::Timeout),
                          "request exceeded the execution timeout");
      }
    };
  };
}

auto use_request_validation() -> RequestMiddleware {
  return [](const MiddlewareFactoryContext & /*factory*/,
            RequestDelegate next) -> RequestDelegate {
    return [next = std::move(next)](RequestContext &context) -> task<void> {
      const auto &query = context.request.query;
      const bool blank = std::ranges::all_of(query, [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
      });
      if (blank) {
        context.add_error(make_error_code(Error::InvalidArgument),
                          "request does not contain a query document");
        co_return;
      }
      co_await next(context);
    };
  };
}

auto use_operation_execution() -> RequestMiddleware {
  return [](const MiddlewareFactoryContext &factory,
            RequestDelegate next) -> RequestDelegate {
    return [activator = factory.activator,
            next = std::move(next)](RequestContext &context) -> task<void> {
      auto executor = activator->resolve<IOperationExecutor>();
      if (!executor) {
        context.add_error(make_error_code(Error::NoOperationExecutor),
                          "no operation executor is registered");
        co_return;
      }
      auto result = co_await executor->execute(context);
      if (!result && result.error() == make_error_code(Error::Cancelled)) {
        // Whoever cancelled the request reports it.
        co_return;
      }
      if (!result) {
        context.add_error(result.error(), result.error().message());
        co_return;
      }
      context.result = std::move(*result);
      co_await next(context);
    };
  };
}

auto default_pipeline() -> RequestPipeline {
  return {use_instrumentation(), use_exception_handling(),
          use_request_timeout(), use_request_validation(),
          use_operation_execution()};
}

} // namespace gqlexec
