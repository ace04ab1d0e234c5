#pragma once

#include "gqlexec/config/factory_options.hpp"
#include "gqlexec/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace gqlexec {

using OptionsChangeCallback = std::function<void(const ExecutorName &)>;
using ListenerId = std::uint64_t;

// Supplies factory options per executor name and reports when they change.
class IFactoryOptionsSource {
public:
  virtual ~IFactoryOptionsSource() = default;

  [[nodiscard]] virtual auto get(const ExecutorName &name) const
      -> FactoryOptions = 0;
  virtual auto add_change_listener(OptionsChangeCallback callback)
      -> ListenerId = 0;
  virtual auto remove_change_listener(ListenerId id) -> void = 0;
};

// In-memory options source. Every mutation notifies listeners with the name
// that changed, after the store lock has been released. Empty names address
// the default executor.
class FactoryOptionsStore final : public IFactoryOptionsSource {
public:
  FactoryOptionsStore() = default;

  FactoryOptionsStore(const FactoryOptionsStore &) = delete;
  auto operator=(const FactoryOptionsStore &) -> FactoryOptionsStore & = delete;

  [[nodiscard]] auto get(const ExecutorName &name) const
      -> FactoryOptions override;
  auto add_change_listener(OptionsChangeCallback callback)
      -> ListenerId override;
  auto remove_change_listener(ListenerId id) -> void override;

  /// Edits the options of `name` in place (creating them if absent).
  auto configure(const ExecutorName &name,
                 const std::function<void(FactoryOptions &)> &edit) -> void;
  auto replace(const ExecutorName &name, FactoryOptions options) -> void;
  auto remove(const ExecutorName &name) -> bool;

  [[nodiscard]] auto names() const -> std::vector<ExecutorName>;
  [[nodiscard]] auto contains(const ExecutorName &name) const -> bool;

private:
  auto notify(const ExecutorName &name) -> void;

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<ExecutorName, FactoryOptions> options_;

  std::mutex listeners_mu_;
  std::vector<std::pair<ListenerId, OptionsChangeCallback>> listeners_;
  ListenerId next_listener_id_{1};
};

} // namespace gqlexec
