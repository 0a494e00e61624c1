#include "pml/component/component.hpp"

#include "pml/core/identity.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

namespace pml {

namespace {

void claim_component_brand() {
  static const bool claimed = [] {
    auto ec = core::identity_registry().claim(core::kComponentBrand, "pml-1");
    if (ec) {
      core::detail::logger().warn("brand {} already owned by {}",
                                  core::kComponentBrand,
                                  core::identity_registry().owner(core::kComponentBrand));
    }
    return !ec;
  }();
  (void)claimed;
}

const Value kUndefined{};

}  // namespace

const Value& Props::operator[](std::string_view key) const noexcept {
  const Value* v = values_.find(key);
  return v != nullptr ? *v : kUndefined;
}

bool Props::has(std::string_view key) const noexcept {
  const Value* v = values_.find(key);
  return v != nullptr && !v->is_undefined();
}

std::string Props::string_or(std::string_view key, std::string_view fallback) const {
  if (const auto s = (*this)[key].as_string()) {
    return std::string(*s);
  }
  return std::string(fallback);
}

double Props::number_or(std::string_view key, double fallback) const noexcept {
  return (*this)[key].as_number().value_or(fallback);
}

bool Props::bool_or(std::string_view key, bool fallback) const noexcept {
  return (*this)[key].as_bool().value_or(fallback);
}

Component::Component() noexcept : brand_(core::kComponentBrand.data()) {
  claim_component_brand();
}

asio::awaitable<Value> Component::resolve(const Props&, RenderContext&) const {
  co_return Value{};
}

Node Component::render(const Props&, const Value& resolved, RenderContext&) const {
  return to_display_string(resolved);
}

std::optional<std::string> Component::scope(const Props&) const { return std::nullopt; }

Object Component::bindings(const Props&) const { return {}; }

bool is_component_class(const Component* component) noexcept {
  return component != nullptr && core::brand_matches(component->brand(), core::kComponentBrand);
}

}  // namespace pml
