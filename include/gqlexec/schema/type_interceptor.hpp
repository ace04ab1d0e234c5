#pragma once

#include "gqlexec/schema/schema.hpp"

namespace gqlexec {

// Hook into SchemaBuilder::create(). Interceptors run in registration order
// for each phase.
class TypeInterceptor {
public:
  virtual ~TypeInterceptor() = default;

  [[nodiscard]] virtual auto can_handle_schema() const -> bool { return true; }

  virtual auto on_before_complete_name(SchemaDefinition & /*definition*/)
      -> void {}

  virtual auto on_after_complete_name(SchemaDefinition & /*definition*/)
      -> void {}
};

} // namespace gqlexec
