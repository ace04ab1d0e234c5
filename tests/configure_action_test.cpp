#include "gqlexec/config/configure_action.hpp"

#include "test_utils.hpp"

#include <boost/asio/steady_timer.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace gqlexec {
namespace {

struct Trace {
  std::vector<std::string> steps;
};

auto record_sync(std::string step) -> SyncConfigure<Trace> {
  return [step = std::move(step)](Trace &t) -> Result<void> {
    t.steps.push_back(step);
    return ok();
  };
}

// Suspends on a timer before recording, so a later action that ran early
// would show up out of order.
auto record_async(std::string step) -> AsyncConfigure<Trace> {
  return [step = std::move(step)](Trace &t) -> task<Result<void>> {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                    std::chrono::milliseconds(2));
    co_await timer.async_wait(use_nothrow);
    t.steps.push_back(step);
    co_return ok();
  };
}

TEST(ConfigureActionTest, EveryShapeRunsInListOrder) {
  ConfigureActions<Trace> actions{
      async_action<Trace>(record_async("a-async")),
      sync_action<Trace>(record_sync("b-sync")),
      combined_action<Trace>(record_sync("c-sync"), record_async("c-async")),
      async_action<Trace>(record_async("d-async")),
  };

  Trace trace;
  auto applied = test::run_coro(apply_actions(actions, trace));

  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(trace.steps, (std::vector<std::string>{"a-async", "b-sync",
                                                   "c-sync", "c-async",
                                                   "d-async"}));
}

TEST(ConfigureActionTest, FailureStopsTheSequence) {
  ConfigureActions<Trace> actions{
      sync_action<Trace>(record_sync("first")),
      sync_action<Trace>([](Trace &) -> Result<void> {
        return fail(Error::ActionFailed);
      }),
      sync_action<Trace>(record_sync("never")),
  };

  Trace trace;
  auto applied = test::run_coro(apply_actions(actions, trace));

  ASSERT_FALSE(applied.has_value());
  EXPECT_EQ(applied.error(), make_error_code(Error::ActionFailed));
  EXPECT_EQ(trace.steps, std::vector<std::string>{"first"});
}

TEST(ConfigureActionTest, CombinedActionSkipsAsyncPartWhenSyncFails) {
  bool async_ran = false;
  auto action = combined_action<Trace>(
      [](Trace &) -> Result<void> { return fail(Error::InvalidArgument); },
      [&async_ran](Trace &) -> task<Result<void>> {
        async_ran = true;
        co_return ok();
      });

  Trace trace;
  auto applied = test::run_coro(apply_action(action, trace));

  ASSERT_FALSE(applied.has_value());
  EXPECT_EQ(applied.error(), make_error_code(Error::InvalidArgument));
  EXPECT_FALSE(async_ran);
}

TEST(ConfigureActionTest, EmptyCallablesAreNoOps) {
  ConfigureActions<Trace> actions{
      sync_action<Trace>(nullptr),
      async_action<Trace>(nullptr),
      combined_action<Trace>(nullptr, record_async("only")),
  };

  Trace trace;
  auto applied = test::run_coro(apply_actions(actions, trace));

  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(trace.steps, std::vector<std::string>{"only"});
}

} // namespace
} // namespace gqlexec
