#include "gqlexec/execution/schema_assembler.hpp"

#include "gqlexec/core/asio_awaitable.hpp"
#include "gqlexec/schema/schema.hpp"
#include "gqlexec/schema/type_interceptor.hpp"
#include "gqlexec/util/log.hpp"

#include <string>
#include <utility>

namespace gqlexec {
namespace {

// Binds the schema name to the executor name. Registered after all user
// interceptors so it has the final word in the before-complete-name phase.
class SetSchemaNameInterceptor final : public TypeInterceptor {
public:
  explicit SetSchemaNameInterceptor(ExecutorName name)
      : name_(std::move(name)) {}

  auto on_before_complete_name(SchemaDefinition &definition) -> void override {
    definition.name = name_.str();
  }

private:
  ExecutorName name_;
};

[[nodiscard]] auto check_schema_name(const Schema &schema,
                                     const ExecutorName &expected)
    -> Result<void> {
  if (expected != schema.name()) {
    return fail(Error::SchemaNameMismatch);
  }
  return ok();
}

} // namespace

auto resolve_schema(const ExecutorName &name, const FactoryOptions &options,
                    std::shared_ptr<const ServiceProvider> services)
    -> task<Result<std::shared_ptr<const Schema>>> {
  if (options.schema) {
    if (auto valid = check_schema_name(*options.schema, name); !valid) {
      log::warn("Pre-built schema '{}' registered for executor {}",
                options.schema->name(), name);
      co_return fail(valid.error());
    }
    co_return ok(options.schema);
  }

  SchemaBuilder builder = options.schema_builder.value_or(SchemaBuilder{});
  if (auto applied = co_await apply_actions(options.schema_builder_actions,
                                            builder);
      !applied) {
    co_return fail(applied.error());
  }

  builder.add_type_interceptor(std::make_shared<SetSchemaNameInterceptor>(name))
      .add_services(std::move(services));

  auto schema = builder.create();
  if (!schema) {
    co_return fail(schema.error());
  }
  if (auto valid = check_schema_name(**schema, name); !valid) {
    log::error("Schema for executor {} completed with name '{}'", name,
               (*schema)->name());
    co_return fail(valid.error());
  }
  co_return ok(std::move(*schema));
}

} // namespace gqlexec
