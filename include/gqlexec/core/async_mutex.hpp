#pragma once

#include "gqlexec/core/coroutine.hpp"
#include "gqlexec/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <optional>
#include <utility>

namespace gqlexec {

// Coroutine-aware mutual exclusion built on a single-slot concurrent_channel.
// Acquiring parks the caller in async_send until the holder drains the slot,
// so waiters resume in FIFO order and never block a thread. Pending and
// future acquisitions fail with Error::Disposed once close() is called.
class AsyncMutex {
  using SlotChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::any_io_executor, void(boost::system::error_code)>;

public:
  class Guard {
  public:
    Guard() = default;
    explicit Guard(AsyncMutex *owner) noexcept : owner_(owner) {}
    ~Guard() { unlock(); }

    Guard(const Guard &) = delete;
    auto operator=(const Guard &) -> Guard & = delete;

    Guard(Guard &&other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
    auto operator=(Guard &&other) noexcept -> Guard & {
      if (this != &other) {
        unlock();
        owner_ = std::exchange(other.owner_, nullptr);
      }
      return *this;
    }

    auto unlock() noexcept -> void {
      if (owner_ != nullptr) {
        std::exchange(owner_, nullptr)->release();
      }
    }

    [[nodiscard]] auto owns_lock() const noexcept -> bool {
      return owner_ != nullptr;
    }

  private:
    AsyncMutex *owner_{nullptr};
  };

  explicit AsyncMutex(boost::asio::any_io_executor executor);
  ~AsyncMutex();

  AsyncMutex(const AsyncMutex &) = delete;
  auto operator=(const AsyncMutex &) -> AsyncMutex & = delete;

  /// Suspends until the lock is held. Fails with Error::Cancelled when the
  /// calling coroutine is cancelled while waiting, Error::Disposed after
  /// close().
  [[nodiscard]] auto async_lock() -> task<Result<Guard>>;

  [[nodiscard]] auto try_lock() -> std::optional<Guard>;

  auto close() noexcept -> void;
  [[nodiscard]] auto is_closed() const noexcept -> bool {
    return closed_.load(std::memory_order_acquire);
  }

private:
  auto release() noexcept -> void;

  SlotChannel slot_;
  std::atomic<bool> closed_{false};
};

} // namespace gqlexec
