#include "pml/element/children.hpp"

namespace pml {

namespace {

void collect(const Value& node, std::string_view name, std::vector<ElementPtr>& out) {
  if (const auto* arr = node.get_if<Array>()) {
    for (const auto& child : *arr) {
      collect(child, name, out);
    }
    return;
  }
  const auto* el = node.get_if<ElementPtr>();
  if (el == nullptr || !*el || !is_branded_element(el->get())) {
    return;
  }
  if ((*el)->is_fragment()) {
    for (const auto& child : (*el)->children()) {
      collect(child, name, out);
    }
    return;
  }
  if ((*el)->type_name() == name) {
    out.push_back(*el);
  }
}

void append_text(const Value& node, std::string& out) {
  if (const auto* s = node.get_if<std::string>()) {
    out += *s;
    return;
  }
  if (const auto* d = node.get_if<double>()) {
    out += format_number(*d);
    return;
  }
  if (const auto* arr = node.get_if<Array>()) {
    for (const auto& child : *arr) {
      append_text(child, out);
    }
    return;
  }
  const auto* el = node.get_if<ElementPtr>();
  if (el == nullptr || !*el || !is_branded_element(el->get())) {
    return;
  }
  if ((*el)->is_text()) {
    if (const auto* v = (*el)->props().find("value")) {
      out += to_display_string(*v);
    }
  }
  if ((*el)->is_text() || (*el)->is_fragment()) {
    for (const auto& child : (*el)->children()) {
      append_text(child, out);
    }
  }
}

}  // namespace

std::vector<ElementPtr> find_children_of_type(const Array& children, std::string_view name) {
  std::vector<ElementPtr> out;
  for (const auto& child : children) {
    collect(child, name, out);
  }
  return out;
}

bool has_child_of_type(const Array& children, std::string_view name) {
  return !find_children_of_type(children, name).empty();
}

std::string text_of(const Array& children) {
  std::string out;
  for (const auto& child : children) {
    append_text(child, out);
  }
  return out;
}

}  // namespace pml
