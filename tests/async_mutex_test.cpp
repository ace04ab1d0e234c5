#include "gqlexec/core/async_mutex.hpp"

#include "test_utils.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/steady_timer.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <optional>

namespace gqlexec {
namespace {

TEST(AsyncMutexTest, TryLockIsExclusiveUntilReleased) {
  boost::asio::io_context io;
  AsyncMutex mutex(io.get_executor());

  auto first = mutex.try_lock();
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(first->owns_lock());
  EXPECT_FALSE(mutex.try_lock().has_value());

  first->unlock();
  EXPECT_FALSE(first->owns_lock());
  EXPECT_TRUE(mutex.try_lock().has_value());
}

TEST(AsyncMutexTest, AsyncLockSerializesCoroutines) {
  boost::asio::io_context io;
  AsyncMutex mutex(io.get_executor());
  int in_flight = 0;
  int max_in_flight = 0;
  int completed = 0;

  auto worker = [&]() -> task<void> {
    auto guard = co_await mutex.async_lock();
    EXPECT_TRUE(guard.has_value());
    max_in_flight = std::max(max_in_flight, ++in_flight);
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                    std::chrono::milliseconds(5));
    co_await timer.async_wait(use_nothrow);
    --in_flight;
    ++completed;
  };

  for (int i = 0; i < 4; ++i) {
    co_spawn(io, worker(), detached);
  }
  io.run_for(std::chrono::seconds(5));

  EXPECT_EQ(completed, 4);
  EXPECT_EQ(max_in_flight, 1);
}

TEST(AsyncMutexTest, CloseFailsFutureAcquisitions) {
  boost::asio::io_context io;
  AsyncMutex mutex(io.get_executor());
  mutex.close();

  EXPECT_TRUE(mutex.is_closed());
  auto guard = test::run_coro(io, mutex.async_lock());
  ASSERT_FALSE(guard.has_value());
  EXPECT_EQ(guard.error(), make_error_code(Error::Disposed));
  EXPECT_FALSE(mutex.try_lock().has_value());
}

TEST(AsyncMutexTest, CloseWakesParkedWaiter) {
  boost::asio::io_context io;
  AsyncMutex mutex(io.get_executor());
  auto held = mutex.try_lock();
  ASSERT_TRUE(held.has_value());

  std::optional<Result<AsyncMutex::Guard>> outcome;
  co_spawn(
      io,
      [&]() -> task<void> { outcome.emplace(co_await mutex.async_lock()); },
      detached);
  io.run_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(outcome.has_value());

  mutex.close();
  io.restart();
  io.run_for(std::chrono::seconds(1));
  ASSERT_TRUE(outcome.has_value());
  ASSERT_FALSE(outcome->has_value());
  EXPECT_EQ(outcome->error(), make_error_code(Error::Disposed));
}

TEST(AsyncMutexTest, CancelledWaiterReportsCancelled) {
  boost::asio::io_context io;
  AsyncMutex mutex(io.get_executor());
  auto held = mutex.try_lock();
  ASSERT_TRUE(held.has_value());

  boost::asio::cancellation_signal signal;
  std::optional<Result<AsyncMutex::Guard>> outcome;
  co_spawn(
      io,
      [&]() -> task<void> { outcome.emplace(co_await mutex.async_lock()); },
      boost::asio::bind_cancellation_slot(signal.slot(), detached));
  io.run_for(std::chrono::milliseconds(20));
  ASSERT_FALSE(outcome.has_value());

  signal.emit(boost::asio::cancellation_type::terminal);
  io.restart();
  io.run_for(std::chrono::seconds(1));
  ASSERT_TRUE(outcome.has_value());
  ASSERT_FALSE(outcome->has_value());
  EXPECT_EQ(outcome->error(), make_error_code(Error::Cancelled));

  // The holder is unaffected and the lock is still usable afterwards.
  held->unlock();
  EXPECT_TRUE(mutex.try_lock().has_value());
}

} // namespace
} // namespace gqlexec
