#pragma once

#include "gqlexec/config/options_source.hpp"
#include "gqlexec/core/async_mutex.hpp"
#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/core/error.hpp"
#include "gqlexec/util/enum.hpp"
#include "gqlexec/util/id.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/describe/enum.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace gqlexec {

class IDiagnosticEvents;
class RequestExecutor;
class ServiceProvider;

enum class ExecutorEvent : std::uint8_t { Created, Evicted };
BOOST_DESCRIBE_ENUM(ExecutorEvent, Created, Evicted)
GQLEXEC_DEFINE_ENUM_SERDE(ExecutorEvent, ExecutorEvent::Created)

using ExecutorPtr = std::shared_ptr<const RequestExecutor>;
using ExecutorEventHandler =
    std::function<void(const ExecutorName &, const ExecutorPtr &)>;
using SubscriptionId = std::uint64_t;

// Caches one compiled executor per name and builds missing ones on demand.
//
// Lookups read an immutable snapshot of the cache and never suspend. Builds
// are serialized by a single AsyncMutex for all names: a caller that misses
// waits for the lock, checks the cache again, and only then builds. A failed
// or cancelled build leaves the cache untouched, so the next call starts
// over. Events are emitted after the lock has been released.
//
// The registry subscribes to the options source and evicts a name whenever
// its options change; the executor is rebuilt lazily on the next lookup.
// Callers must let outstanding get_or_create() calls finish before
// destroying the registry.
class ExecutorRegistry {
public:
  ExecutorRegistry(boost::asio::any_io_executor executor,
                   std::shared_ptr<IFactoryOptionsSource> options,
                   std::shared_ptr<const ServiceProvider> services = nullptr,
                   std::shared_ptr<IDiagnosticEvents> diagnostics = nullptr);
  ~ExecutorRegistry();

  ExecutorRegistry(const ExecutorRegistry &) = delete;
  auto operator=(const ExecutorRegistry &) -> ExecutorRegistry & = delete;
  ExecutorRegistry(ExecutorRegistry &&) = delete;
  auto operator=(ExecutorRegistry &&) -> ExecutorRegistry & = delete;

  /// Cached executor for `name` (default name when empty), building it on a
  /// miss. Honors cancellation of the calling coroutine while waiting for the
  /// build lock and between configuration actions (Error::Cancelled).
  [[nodiscard]] auto get_or_create(ExecutorName name = {})
      -> task<Result<ExecutorPtr>>;

  /// Cached executor or nullptr; never builds.
  [[nodiscard]] auto try_get(const ExecutorName &name) const -> ExecutorPtr;

  /// Removes the cached executor; true when one was removed.
  [[nodiscard]] auto evict(ExecutorName name = {}) -> Result<bool>;

  auto on_configuration_changed(const ExecutorName &name) -> void;

  auto subscribe(ExecutorEvent event, ExecutorEventHandler handler)
      -> SubscriptionId;
  auto unsubscribe(SubscriptionId id) -> bool;

  /// Drops every cached executor and fails pending and future calls with
  /// Error::Disposed. Idempotent.
  auto dispose() noexcept -> void;
  [[nodiscard]] auto is_disposed() const noexcept -> bool {
    return disposed_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto size() const -> std::size_t;

private:
  using Cache = ankerl::unordered_dense::map<ExecutorName, ExecutorPtr>;

  struct BuildOutcome {
    ExecutorPtr executor;
    bool created{false};
  };

  struct Subscriber {
    SubscriptionId id;
    ExecutorEvent event;
    ExecutorEventHandler handler;
  };

  // Lets the options source call back into the registry only while it is
  // alive; dispose() waits for an in-progress callback to return.
  struct ListenerState {
    std::mutex mu;
    ExecutorRegistry *registry{nullptr};
  };

  [[nodiscard]] auto lock_and_build(const ExecutorName &name)
      -> task<Result<BuildOutcome>>;
  [[nodiscard]] auto build_executor(const ExecutorName &name)
      -> task<Result<ExecutorPtr>>;
  [[nodiscard]] auto publish(const ExecutorName &name, ExecutorPtr executor)
      -> bool;
  [[nodiscard]] auto remove(const ExecutorName &name) -> ExecutorPtr;
  auto emit(ExecutorEvent event, const ExecutorName &name,
            const ExecutorPtr &executor) -> void;

  std::shared_ptr<IFactoryOptionsSource> options_;
  std::shared_ptr<const ServiceProvider> services_;
  std::shared_ptr<IDiagnosticEvents> diagnostics_;

  AsyncMutex build_lock_;
  std::atomic<std::shared_ptr<const Cache>> cache_;
  std::atomic<bool> disposed_{false};

  std::shared_ptr<ListenerState> listener_state_;
  ListenerId options_listener_{0};

  std::mutex subscribers_mu_;
  std::vector<Subscriber> subscribers_;
  SubscriptionId next_subscription_{1};
};

} // namespace gqlexec
