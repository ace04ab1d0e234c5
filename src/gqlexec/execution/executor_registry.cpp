#include "gqlexec/execution/executor_registry.hpp"

#include "gqlexec/core/asio_awaitable.hpp"
#include "gqlexec/execution/activator.hpp"
#include "gqlexec/execution/configuration_assembler.hpp"
#include "gqlexec/execution/diagnostic_events.hpp"
#include "gqlexec/execution/error_filter_aggregator.hpp"
#include "gqlexec/execution/error_handler.hpp"
#include "gqlexec/execution/pipeline_assembler.hpp"
#include "gqlexec/execution/request_executor.hpp"
#include "gqlexec/execution/schema_assembler.hpp"
#include "gqlexec/service/service_provider.hpp"
#include "gqlexec/util/log.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <exception>
#include <utility>

namespace gqlexec {

ExecutorRegistry::ExecutorRegistry(
    boost::asio::any_io_executor executor,
    std::shared_ptr<IFactoryOptionsSource> options,
    std::shared_ptr<const ServiceProvider> services,
    std::shared_ptr<IDiagnosticEvents> diagnostics)
    : options_(options ? std::move(options)
                       : std::make_shared<FactoryOptionsStore>()),
      services_(services ? std::move(services)
                         : std::make_shared<const ServiceProvider>()),
      diagnostics_(std::move(diagnostics)), build_lock_(std::move(executor)),
      cache_(std::make_shared<const Cache>()),
      listener_state_(std::make_shared<ListenerState>()) {
  listener_state_->registry = this;
  options_listener_ = options_->add_change_listener(
      [state = listener_state_](const ExecutorName &name) {
        std::scoped_lock lock(state->mu);
        if (state->registry != nullptr) {
          state->registry->on_configuration_changed(name);
        }
      });
}

ExecutorRegistry::~ExecutorRegistry() { dispose(); }

auto ExecutorRegistry::get_or_create(ExecutorName name)
    -> task<Result<ExecutorPtr>> {
  if (is_disposed()) {
    co_return fail(Error::Disposed);
  }
  name = resolve_name(std::move(name));

  if (auto cached = try_get(name)) {
    co_return ok(std::move(cached));
  }

  Result<BuildOutcome> outcome = fail(Error::Unknown);
  try {
    outcome = co_await lock_and_build(name);
  } catch (const boost::system::system_error &e) {
    if (e.code() != boost::asio::error::operation_aborted) {
      throw;
    }
    outcome = fail(Error::Cancelled);
  }

  if (!outcome) {
    if (outcome.error() == make_error_code(Error::Cancelled)) {
      log::debug("Build of executor {} cancelled", name);
    } else {
      log::warn("Failed to build executor {}: {}", name,
                outcome.error().message());
    }
    co_return fail(outcome.error());
  }

  if (outcome->created) {
    emit(ExecutorEvent::Created, name, outcome->executor);
  }
  co_return ok(std::move(outcome->executor));
}

auto ExecutorRegistry::lock_and_build(const ExecutorName &name)
    -> task<Result<BuildOutcome>> {
  auto guard = co_await build_lock_.async_lock();
  if (!guard) {
    co_return fail(guard.error());
  }

  // Another caller may have finished the same build while we waited.
  if (auto cached = try_get(name)) {
    co_return ok(BuildOutcome{.executor = std::move(cached)});
  }
  if (is_disposed()) {
    co_return fail(Error::Disposed);
  }
  if (auto cancelled = co_await check_cancelled(); !cancelled) {
    co_return fail(cancelled.error());
  }

  log::debug("Building executor {}", name);
  auto built = co_await build_executor(name);
  if (!built) {
    co_return fail(built.error());
  }
  if (!publish(name, *built)) {
    co_return fail(Error::Disposed);
  }
  co_return ok(BuildOutcome{.executor = std::move(*built), .created = true});
}

auto ExecutorRegistry::build_executor(const ExecutorName &name)
    -> task<Result<ExecutorPtr>> {
  const FactoryOptions options = options_->get(name);

  auto executor_options = co_await resolve_executor_options(
      options.executor_options, options.executor_options_actions);
  if (!executor_options) {
    co_return fail(executor_options.error());
  }
  auto resolved =
      std::make_shared<const ExecutorOptions>(std::move(*executor_options));

  auto schema = co_await resolve_schema(name, options, services_);
  if (!schema) {
    co_return fail(schema.error());
  }

  auto error_handler = std::make_shared<const ErrorHandler>(
      collect_error_filters(options, *resolved, *services_), *resolved);
  auto activator = std::make_shared<const Activator>(services_);
  auto pipeline = compose_pipeline(name, options.pipeline, services_, activator,
                                   error_handler, resolved, diagnostics_);

  auto executor = std::make_shared<RequestExecutor>(RequestExecutorParts{
      .name = name,
      .schema = std::move(*schema),
      .options = std::move(resolved),
      .error_handler = std::move(error_handler),
      .activator = std::move(activator),
      .services = services_,
      .diagnostics = diagnostics_,
      .pipeline = std::move(pipeline),
  });
  co_return ok(ExecutorPtr{std::move(executor)});
}

auto ExecutorRegistry::try_get(const ExecutorName &name) const -> ExecutorPtr {
  auto snapshot = cache_.load(std::memory_order_acquire);
  auto it = snapshot->find(resolve_name(name));
  return it != snapshot->end() ? it->second : nullptr;
}

auto ExecutorRegistry::publish(const ExecutorName &name, ExecutorPtr executor)
    -> bool {
  auto current = cache_.load(std::memory_order_acquire);
  while (!is_disposed()) {
    auto next = std::make_shared<Cache>(*current);
    next->insert_or_assign(name, executor);
    if (cache_.compare_exchange_weak(current,
                                     std::shared_ptr<const Cache>(std::move(next)),
                                     std::memory_order_acq_rel,
                                     std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

auto ExecutorRegistry::remove(const ExecutorName &name) -> ExecutorPtr {
  auto current = cache_.load(std::memory_order_acquire);
  for (;;) {
    auto it = current->find(name);
    if (it == current->end()) {
      return nullptr;
    }
    auto removed = it->second;
    auto next = std::make_shared<Cache>(*current);
    next->erase(name);
    if (cache_.compare_exchange_weak(current,
                                     std::shared_ptr<const Cache>(std::move(next)),
                                     std::memory_order_acq_rel,
                                     std::memory_order_acquire)) {
      return removed;
    }
  }
}

auto ExecutorRegistry::evict(ExecutorName name) -> Result<bool> {
  if (is_disposed()) {
    return fail(Error::Disposed);
  }
  name = resolve_name(std::move(name));

  auto removed = remove(name);
  if (!removed) {
    return ok(false);
  }
  log::debug("Evicted executor {}", name);
  emit(ExecutorEvent::Evicted, name, removed);
  return ok(true);
}

auto ExecutorRegistry::on_configuration_changed(const ExecutorName &name)
    -> void {
  auto evicted = evict(name);
  if (!evicted) {
    log::debug("Ignoring configuration change for {}: {}", resolve_name(name),
               evicted.error().message());
  } else if (*evicted) {
    log::info("Configuration of executor {} changed; rebuilding on next use",
              resolve_name(name));
  }
}

auto ExecutorRegistry::subscribe(ExecutorEvent event,
                                 ExecutorEventHandler handler)
    -> SubscriptionId {
  std::scoped_lock lock(subscribers_mu_);
  auto id = next_subscription_++;
  subscribers_.push_back(
      Subscriber{.id = id, .event = event, .handler = std::move(handler)});
  return id;
}

auto ExecutorRegistry::unsubscribe(SubscriptionId id) -> bool {
  std::scoped_lock lock(subscribers_mu_);
  return std::erase_if(subscribers_, [id](const Subscriber &s) {
           return s.id == id;
         }) > 0;
}

auto ExecutorRegistry::emit(ExecutorEvent event, const ExecutorName &name,
                            const ExecutorPtr &executor) -> void {
  if (diagnostics_) {
    try {
      if (event == ExecutorEvent::Created) {
        diagnostics_->executor_created(name, *executor);
      } else {
        diagnostics_->executor_evicted(name, *executor);
      }
    } catch (const std::exception &e) {
      log::warn("Diagnostics failed on {} event for executor {}: {}",
                to_string_view(event), name, e.what());
    }
  }

  std::vector<ExecutorEventHandler> handlers;
  {
    std::scoped_lock lock(subscribers_mu_);
    for (const auto &subscriber : subscribers_) {
      if (subscriber.event == event) {
        handlers.push_back(subscriber.handler);
      }
    }
  }
  for (const auto &handler : handlers) {
    try {
      handler(name, executor);
    } catch (const std::exception &e) {
      log::warn("Subscriber failed on {} event for executor {}: {}",
                to_string_view(event), name, e.what());
    }
  }
}

auto ExecutorRegistry::dispose() noexcept -> void {
  if (disposed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  {
    std::scoped_lock lock(listener_state_->mu);
    listener_state_->registry = nullptr;
  }
  options_->remove_change_listener(options_listener_);
  build_lock_.close();

  auto previous =
      cache_.exchange(std::make_shared<const Cache>(), std::memory_order_acq_rel);
  log::debug("Executor registry disposed, released {} executors",
             previous->size());

  std::scoped_lock lock(subscribers_mu_);
  subscribers_.clear();
}

auto ExecutorRegistry::size() const -> std::size_t {
  return cache_.load(std::memory_order_acquire)->size();
}

} // namespace gqlexec
