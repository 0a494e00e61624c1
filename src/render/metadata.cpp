#include "pml/render/metadata.hpp"

#include "pml/component/component.hpp"

namespace pml {

namespace {

const Element* as_prompt(const Value& node) {
  const auto* ptr = node.get_if<ElementPtr>();
  if (ptr == nullptr || !*ptr || !is_branded_element(ptr->get())) {
    return nullptr;
  }
  const auto* component = (*ptr)->component();
  if (component == nullptr || component->name() != "Prompt") {
    return nullptr;
  }
  return ptr->get();
}

std::optional<std::string> string_prop(const Object& props, std::string_view key) {
  const auto* v = props.find(key);
  if (v == nullptr) {
    return std::nullopt;
  }
  if (const auto s = v->as_string()) {
    return std::string(*s);
  }
  return std::nullopt;
}

}  // namespace

std::optional<PromptMetadata> extract_metadata(const Node& root) {
  const Element* prompt = as_prompt(root);
  if (prompt == nullptr) {
    if (const auto* ptr = root.get_if<ElementPtr>(); ptr != nullptr && *ptr && (*ptr)->is_fragment()) {
      for (const auto& child : (*ptr)->children()) {
        if ((prompt = as_prompt(child)) != nullptr) {
          break;
        }
      }
    }
  }
  if (prompt == nullptr) {
    return std::nullopt;
  }

  const auto& props = prompt->props();
  auto name = string_prop(props, "name");
  if (!name) {
    return std::nullopt;
  }

  PromptMetadata meta;
  meta.name = std::move(*name);
  meta.description = string_prop(props, "description");
  meta.version = string_prop(props, "version");
  if (const auto* tags = props.find("tags")) {
    if (const auto* arr = tags->get_if<Array>()) {
      for (const auto& tag : *arr) {
        if (const auto s = tag.as_string()) {
          meta.tags.emplace_back(*s);
        }
      }
    }
  }
  return meta;
}

}  // namespace pml
