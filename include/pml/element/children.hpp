#pragma once

#include "pml/element/element.hpp"

#include <string_view>
#include <vector>

namespace pml {

// 按组件名查找子元素；Fragment 视为透明（继续向下查找），不进入其他组件内部。
[[nodiscard]] std::vector<ElementPtr> find_children_of_type(const Array& children, std::string_view name);

[[nodiscard]] bool has_child_of_type(const Array& children, std::string_view name);

// 子节点中的纯文本（字符串与数字直接拼接，进入 Fragment 与 Text，跳过组件）。
[[nodiscard]] std::string text_of(const Array& children);

}  // namespace pml
