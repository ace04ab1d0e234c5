#include "gqlexec/execution/error_filter_aggregator.hpp"
#include "gqlexec/execution/error_handler.hpp"
#include "gqlexec/service/service_provider.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace gqlexec {
namespace {

// Appends its label to the error message.
class LabelFilter final : public IErrorFilter {
public:
  explicit LabelFilter(std::string label) : label_(std::move(label)) {}

  auto on_error(ExecutionError error) -> ExecutionError override {
    error.message += "|" + label_;
    return error;
  }

private:
  std::string label_;
};

auto label_factory(std::string label) -> ErrorFilterFactory {
  return [label = std::move(label)](const ServiceProvider &,
                                    const ExecutorOptions &)
             -> std::shared_ptr<IErrorFilter> {
    return std::make_shared<LabelFilter>(label);
  };
}

TEST(ErrorFilterTest, FactoryFiltersPrecedeRegisteredFilters) {
  ServiceProvider services;
  services.add<IErrorFilter>(std::make_shared<LabelFilter>("global-1"));
  services.add<IErrorFilter>(std::make_shared<LabelFilter>("global-2"));

  FactoryOptions options;
  options.error_filters = {label_factory("local-1"), label_factory("local-2")};

  ErrorHandler handler(collect_error_filters(options, ExecutorOptions{}, services),
                       ExecutorOptions{});
  auto error = handler.handle(ExecutionError{.message = "boom"});

  EXPECT_EQ(handler.filters().size(), 4u);
  EXPECT_EQ(error.message, "boom|local-1|local-2|global-1|global-2");
}

TEST(ErrorFilterTest, FactoriesReceiveResolvedOptions) {
  ExecutorOptions resolved;
  resolved.include_exception_details = true;
  bool saw_details = false;

  FactoryOptions options;
  options.error_filters.push_back(
      [&saw_details](const ServiceProvider &, const ExecutorOptions &o)
          -> std::shared_ptr<IErrorFilter> {
        saw_details = o.include_exception_details;
        return nullptr;
      });

  ServiceProvider services;
  auto filters = collect_error_filters(options, resolved, services);

  EXPECT_TRUE(saw_details);
  // A factory may decline to produce a filter.
  EXPECT_TRUE(filters.empty());
}

TEST(ErrorFilterTest, NoFiltersLeavesErrorUntouched) {
  ErrorHandler handler({}, ExecutorOptions{});
  auto error = handler.create_error(make_error_code(Error::Timeout), "slow");

  auto handled = handler.handle(error);

  EXPECT_EQ(handled.message, "slow");
  EXPECT_EQ(handled.error, make_error_code(Error::Timeout));
  EXPECT_EQ(handled.code, make_error_code(Error::Timeout).message());
}

TEST(ErrorFilterTest, UnexpectedErrorHidesDetailsByDefault) {
  std::runtime_error ex("secret");

  auto hidden = ErrorHandler({}, ExecutorOptions{}).create_unexpected_error(ex);
  EXPECT_EQ(hidden.message, "Unexpected Execution Error");
  EXPECT_FALSE(hidden.extensions.contains("message"));

  ExecutorOptions verbose;
  verbose.include_exception_details = true;
  auto shown = ErrorHandler({}, verbose).create_unexpected_error(ex);
  EXPECT_EQ(shown.extensions.at("message"), "secret");
}

} // namespace
} // namespace gqlexec
