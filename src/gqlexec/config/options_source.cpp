#include "gqlexec/config/options_source.hpp"

#include "gqlexec/util/log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace gqlexec {

auto FactoryOptionsStore::get(const ExecutorName &name) const
    -> FactoryOptions {
  std::scoped_lock lock(mu_);
  auto it = options_.find(resolve_name(name));
  return it != options_.end() ? it->second : FactoryOptions{};
}

auto FactoryOptionsStore::add_change_listener(OptionsChangeCallback callback)
    -> ListenerId {
  std::scoped_lock lock(listeners_mu_);
  auto id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(callback));
  return id;
}

auto FactoryOptionsStore::remove_change_listener(ListenerId id) -> void {
  std::scoped_lock lock(listeners_mu_);
  std::erase_if(listeners_,
                [id](const auto &entry) { return entry.first == id; });
}

auto FactoryOptionsStore::configure(
    const ExecutorName &name,
    const std::function<void(FactoryOptions &)> &edit) -> void {
  auto key = resolve_name(name);
  {
    std::scoped_lock lock(mu_);
    edit(options_[key]);
  }
  notify(key);
}

auto FactoryOptionsStore::replace(const ExecutorName &name,
                                  FactoryOptions options) -> void {
  auto key = resolve_name(name);
  {
    std::scoped_lock lock(mu_);
    options_.insert_or_assign(key, std::move(options));
  }
  notify(key);
}

auto FactoryOptionsStore::remove(const ExecutorName &name) -> bool {
  auto key = resolve_name(name);
  bool removed = false;
  {
    std::scoped_lock lock(mu_);
    removed = options_.erase(key) > 0;
  }
  if (removed) {
    notify(key);
  }
  return removed;
}

auto FactoryOptionsStore::names() const -> std::vector<ExecutorName> {
  std::scoped_lock lock(mu_);
  std::vector<ExecutorName> out;
  out.reserve(options_.size());
  for (const auto &[name, _] : options_) {
    out.push_back(name);
  }
  return out;
}

auto FactoryOptionsStore::contains(const ExecutorName &name) const -> bool {
  std::scoped_lock lock(mu_);
  return options_.contains(resolve_name(name));
}

auto FactoryOptionsStore::notify(const ExecutorName &name) -> void {
  std::vector<OptionsChangeCallback> callbacks;
  {
    std::scoped_lock lock(listeners_mu_);
    callbacks.reserve(listeners_.size());
    for (const auto &[_, callback] : listeners_) {
      callbacks.push_back(callback);
    }
  }
  for (const auto &callback : callbacks) {
    try {
      callback(name);
    } catch (const std::exception &e) {
      log::warn("Options change listener failed for {}: {}", name, e.what());
    }
  }
}

} // namespace gqlexec
