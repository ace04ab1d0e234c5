#pragma once

#include "gqlexec/service/service_provider.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace gqlexec {

// Resolves middleware dependencies from the service provider, constructing
// an instance when none is registered.
class Activator {
public:
  explicit Activator(std::shared_ptr<const ServiceProvider> services)
      : services_(std::move(services)) {}

  template <typename T>
  [[nodiscard]] auto resolve() const -> std::shared_ptr<T> {
    return services_ ? services_->get_service<T>() : nullptr;
  }

  template <typename T, typename... Args>
    requires std::is_constructible_v<T, Args...>
  [[nodiscard]] auto get_or_create(Args &&...args) const -> std::shared_ptr<T> {
    if (auto existing = resolve<T>()) {
      return existing;
    }
    return std::make_shared<T>(std::forward<Args>(args)...);
  }

  [[nodiscard]] auto services() const noexcept
      -> const std::shared_ptr<const ServiceProvider> & {
    return services_;
  }

private:
  std::shared_ptr<const ServiceProvider> services_;
};

} // namespace gqlexec
