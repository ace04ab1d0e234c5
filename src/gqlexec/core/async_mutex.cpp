#include "gqlexec/core/async_mutex.hpp"

#include "gqlexec/core/asio_awaitable.hpp"

#include <boost/system/system_error.hpp>

namespace gqlexec {

AsyncMutex::AsyncMutex(boost::asio::any_io_executor executor)
    : slot_(std::move(executor), 1) {}

AsyncMutex::~AsyncMutex() { close(); }

auto AsyncMutex::async_lock() -> task<Result<Guard>> {
  if (is_closed()) {
    co_return fail(Error::Disposed);
  }
  Result<void> sent = ok();
  try {
    sent = as_result(
        co_await slot_.async_send(boost::system::error_code{}, use_nothrow));
  } catch (const boost::system::system_error &e) {
    // Raised instead of an error code when the coroutine was already
    // cancelled on resumption.
    if (e.code() != boost::asio::error::operation_aborted) {
      throw;
    }
    co_return fail(Error::Cancelled);
  }
  if (!sent) {
    co_return fail(sent.error());
  }
  co_return ok(Guard{this});
}

auto AsyncMutex::try_lock() -> std::optional<Guard> {
  if (is_closed() || !slot_.try_send(boost::system::error_code{})) {
    return std::nullopt;
  }
  return std::optional<Guard>{std::in_place, this};
}

auto AsyncMutex::close() noexcept -> void {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  slot_.close();
}

auto AsyncMutex::release() noexcept -> void {
  // Draining the slot hands it to the oldest parked sender, if any.
  (void)slot_.try_receive([](boost::system::error_code) {});
}

} // namespace gqlexec
