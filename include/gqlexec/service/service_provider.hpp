#pragma once

#include <ankerl/unordered_dense.h>

#include <memory>
#include <typeindex>
#include <vector>

namespace gqlexec {

// Typed service lookup handed to configuration actions, middleware factories
// and error filter factories. Registration happens during application setup;
// lookups afterwards are read-only and safe from any thread.
class ServiceProvider {
public:
  ServiceProvider() = default;

  ServiceProvider(const ServiceProvider &) = delete;
  auto operator=(const ServiceProvider &) -> ServiceProvider & = delete;

  template <typename T> auto add(std::shared_ptr<T> service) -> void {
    services_[std::type_index(typeid(T))].push_back(
        std::static_pointer_cast<void>(std::move(service)));
  }

  /// Most recently registered service of type T, or nullptr.
  template <typename T>
  [[nodiscard]] auto get_service() const -> std::shared_ptr<T> {
    auto it = services_.find(std::type_index(typeid(T)));
    if (it == services_.end() || it->second.empty()) {
      return nullptr;
    }
    return std::static_pointer_cast<T>(it->second.back());
  }

  /// All services registered as T, in registration order.
  template <typename T>
  [[nodiscard]] auto get_services() const -> std::vector<std::shared_ptr<T>> {
    std::vector<std::shared_ptr<T>> out;
    auto it = services_.find(std::type_index(typeid(T)));
    if (it == services_.end()) {
      return out;
    }
    out.reserve(it->second.size());
    for (const auto &service : it->second) {
      out.push_back(std::static_pointer_cast<T>(service));
    }
    return out;
  }

  template <typename T> [[nodiscard]] auto contains() const -> bool {
    return services_.contains(std::type_index(typeid(T)));
  }

private:
  ankerl::unordered_dense::map<std::type_index,
                               std::vector<std::shared_ptr<void>>>
      services_;
};

} // namespace gqlexec
