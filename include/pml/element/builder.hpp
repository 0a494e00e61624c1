#pragma once

#include "pml/component/registry.hpp"
#include "pml/element/element.hpp"

#include <string_view>

namespace pml {

/**
 * @brief 按名字构造元素树的前端。
 *
 * "Fragment" 与 "Text" 是内建类型；其余名字在构造时通过 ComponentLookup
 * 解析为组件引用，查不到时得到 UnresolvedName 类型（渲染时报 unknown_component）。
 *
 *   Builder b{registry};
 *   auto doc = b("Prompt", {{"name", "demo"}}, {b("Task", {}, {"Summarize."})});
 */
class Builder final {
 public:
  explicit Builder(const ComponentLookup& lookup) noexcept : lookup_(lookup) {}

  [[nodiscard]] ElementPtr operator()(std::string_view name, Object props = {}, Array children = {}) const;

  [[nodiscard]] ElementPtr fragment(Array children) const { return pml::fragment(std::move(children)); }

  [[nodiscard]] const ComponentLookup& lookup() const noexcept { return lookup_; }

 private:
  const ComponentLookup& lookup_;
};

}  // namespace pml
