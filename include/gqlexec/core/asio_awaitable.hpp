#pragma once

#include "gqlexec/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_type.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <tuple>

namespace gqlexec {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

/// Map Asio completion codes into the gqlexec category where one exists.
[[nodiscard]] inline auto translate_asio_error(boost::system::error_code ec)
    -> std::error_code {
  if (ec == boost::asio::error::operation_aborted ||
      ec == boost::asio::experimental::error::channel_cancelled) {
    return make_error_code(Error::Cancelled);
  }
  if (ec == boost::asio::experimental::error::channel_closed) {
    return make_error_code(Error::Disposed);
  }
  return ec;
}

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(translate_asio_error(ec));
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(translate_asio_error(ec));
  }
  return ok();
}

/// True once the calling coroutine's cancellation slot has been triggered.
[[nodiscard]] inline auto is_cancelled() -> boost::asio::awaitable<bool> {
  auto state = co_await boost::asio::this_coro::cancellation_state;
  co_return state.cancelled() != boost::asio::cancellation_type::none;
}

[[nodiscard]] inline auto check_cancelled()
    -> boost::asio::awaitable<Result<void>> {
  if (co_await is_cancelled()) {
    co_return fail(Error::Cancelled);
  }
  co_return ok();
}

} // namespace gqlexec
