#include "pml/element/element.hpp"

#include "pml/component/component.hpp"
#include "pml/core/identity.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

namespace pml {
namespace {

// 进程内首次构造 Element 时声明 brand 的所有权；另一副本以不同版本声明
// 同一 key 时只记录告警，不影响按值识别。
void claim_element_brand() {
  static const bool claimed = [] {
    auto ec = core::identity_registry().claim(core::kElementBrand, "pml-1");
    if (ec) {
      core::detail::logger().warn("brand {} already owned by {}",
                                  core::kElementBrand,
                                  core::identity_registry().owner(core::kElementBrand));
    }
    return !ec;
  }();
  (void)claimed;
}

void flatten_into(Array& out, Value&& node) {
  if (node.is_nullish()) {
    return;
  }
  if (const auto* b = node.get_if<bool>(); b != nullptr && !*b) {
    return;
  }
  if (auto* arr = node.get_if<Array>()) {
    for (auto& child : *arr) {
      flatten_into(out, std::move(child));
    }
    return;
  }
  out.push_back(std::move(node));
}

}  // namespace

Element::Element(TypeRef type, Object props, Array children)
    : brand_(core::kElementBrand.data()),
      type_(std::move(type)),
      props_(std::move(props)),
      children_(normalize_children(std::move(children))) {
  claim_element_brand();
}

const Component* Element::component() const noexcept {
  if (const auto* c = std::get_if<ComponentPtr>(&type_)) {
    return c->get();
  }
  return nullptr;
}

std::string Element::type_name() const {
  return std::visit(
    [](const auto& t) -> std::string {
      using T = std::decay_t<decltype(t)>;
      if constexpr (std::is_same_v<T, TextMarker>) {
        return "Text";
      } else if constexpr (std::is_same_v<T, FragmentMarker>) {
        return "Fragment";
      } else if constexpr (std::is_same_v<T, ComponentPtr>) {
        return t ? std::string(t->name()) : std::string("<null>");
      } else {
        return t.name;
      }
    },
    type_);
}

bool is_branded_element(const Element* element) noexcept {
  return element != nullptr && core::brand_matches(element->brand(), core::kElementBrand);
}

bool is_element(const Value& value) noexcept { return value.is_element(); }

Array normalize_children(Array children) {
  Array out;
  out.reserve(children.size());
  for (auto& child : children) {
    flatten_into(out, std::move(child));
  }
  return out;
}

ElementPtr make_element(TypeRef type, Object props, Array children) {
  return std::make_shared<const Element>(std::move(type), std::move(props), std::move(children));
}

ElementPtr make_element(ComponentPtr component, Object props, Array children) {
  return make_element(TypeRef{std::move(component)}, std::move(props), std::move(children));
}

ElementPtr fragment(Array children) {
  return make_element(TypeRef{FragmentMarker{}}, {}, std::move(children));
}

ElementPtr text(std::string value) {
  return make_element(TypeRef{TextMarker{}}, Object{{"value", Value(std::move(value))}}, {});
}

DeferredRef ref(ElementPtr element, Path path) {
  return DeferredRef{std::move(element), std::move(path)};
}

}  // namespace pml
