#pragma once

#include "pml/value/value.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace pml {

class Component;
using ComponentPtr = std::shared_ptr<const Component>;

// 渲染节点与值共用同一表示：原语 / Element / 数组（可嵌套）。
using Node = Value;

struct TextMarker final {
  friend bool operator==(const TextMarker&, const TextMarker&) = default;
};

struct FragmentMarker final {
  friend bool operator==(const FragmentMarker&, const FragmentMarker&) = default;
};

// 构造时目录中查不到的组件名；渲染时记 unknown_component 并回退到子节点。
struct UnresolvedName final {
  std::string name;
  friend bool operator==(const UnresolvedName&, const UnresolvedName&) = default;
};

using TypeRef = std::variant<TextMarker, FragmentMarker, ComponentPtr, UnresolvedName>;

/**
 * @brief 已解析的文档树节点（不可变）。
 *
 * 约定：
 * - 只通过 ElementPtr（shared_ptr<const Element>）持有，身份即指针；
 * - children 在构造时已展开嵌套数组并丢弃 undefined/null/false；
 * - brand() 返回跨副本约定的字符串 key，供 is_element() 按值识别。
 */
class Element final {
 public:
  Element(TypeRef type, Object props, Array children);

  [[nodiscard]] const char* brand() const noexcept { return brand_; }
  [[nodiscard]] const TypeRef& type() const noexcept { return type_; }
  [[nodiscard]] const Object& props() const noexcept { return props_; }
  [[nodiscard]] const Array& children() const noexcept { return children_; }

  [[nodiscard]] bool is_text() const noexcept { return std::holds_alternative<TextMarker>(type_); }
  [[nodiscard]] bool is_fragment() const noexcept { return std::holds_alternative<FragmentMarker>(type_); }

  // 组件引用；文本/片段/未解析名返回 nullptr。
  [[nodiscard]] const Component* component() const noexcept;

  // 用于错误信息与调试输出的类型名（"Fragment"、"Text"、组件名或未解析名）。
  [[nodiscard]] std::string type_name() const;

 private:
  const char* brand_;
  TypeRef type_;
  Object props_;
  Array children_;
};

// 按 brand 判断（不依赖 typeid / dynamic_cast）。
[[nodiscard]] bool is_branded_element(const Element* element) noexcept;
[[nodiscard]] bool is_element(const Value& value) noexcept;

// 展开嵌套数组、丢弃 undefined/null/false。
[[nodiscard]] Array normalize_children(Array children);

[[nodiscard]] ElementPtr make_element(TypeRef type, Object props = {}, Array children = {});
[[nodiscard]] ElementPtr make_element(ComponentPtr component, Object props = {}, Array children = {});
[[nodiscard]] ElementPtr fragment(Array children);
[[nodiscard]] ElementPtr text(std::string value);

/**
 * @brief 构造延迟引用：引用 element 的 resolve 结果中 path 处的值。
 *
 * 例：ref(rating, {"score"}) 表示“rating 的答案对象中的 score 字段”。
 */
[[nodiscard]] DeferredRef ref(ElementPtr element, Path path = {});

}  // namespace pml
