#include "pml/component/registry.hpp"

#include "pml/component/component.hpp"
#include "pml/core/error.hpp"

#include <algorithm>

namespace pml {

std::error_code ComponentRegistry::add(ComponentPtr component) {
  if (!component) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  if (!is_component_class(component.get())) {
    return core::make_error_code(core::errc::not_a_component);
  }
  if (component->name().empty()) {
    return core::make_error_code(core::errc::empty_name);
  }
  std::lock_guard lk(mu_);
  auto [it, inserted] = components_.try_emplace(std::string(component->name()), component);
  if (!inserted && it->second != component) {
    return core::make_error_code(core::errc::already_registered);
  }
  return {};
}

void ComponentRegistry::set(ComponentPtr component) {
  if (!component) {
    return;
  }
  std::lock_guard lk(mu_);
  components_.insert_or_assign(std::string(component->name()), std::move(component));
}

void ComponentRegistry::erase(std::string_view name) noexcept {
  std::lock_guard lk(mu_);
  components_.erase(std::string(name));
}

void ComponentRegistry::clear() noexcept {
  std::lock_guard lk(mu_);
  components_.clear();
}

ComponentPtr ComponentRegistry::lookup(std::string_view name) const {
  std::lock_guard lk(mu_);
  const auto it = components_.find(std::string(name));
  if (it == components_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ComponentRegistry::contains(std::string_view name) const {
  return lookup(name) != nullptr;
}

std::size_t ComponentRegistry::size() const {
  std::lock_guard lk(mu_);
  return components_.size();
}

std::vector<std::string> ComponentRegistry::names() const {
  std::vector<std::string> out;
  {
    std::lock_guard lk(mu_);
    out.reserve(components_.size());
    for (const auto& [name, _] : components_) {
      out.push_back(name);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace pml
