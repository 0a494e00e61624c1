#pragma once

#include "pml/component/component.hpp"

namespace pml::components {

/**
 * @brief 条件渲染。
 *
 * - provider / notProvider（字符串或字符串数组）与 env.llm.provider 比较，设置时优先于 when；
 * - when 为字符串时：以 '=' 开头按公式求值（变量取自 answers），否则非空即真；
 *   公式语法错误记 warn_invalid_formula 并按假处理；
 * - when 为其他类型时按真值判断；缺省为真。
 */
class If final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "If"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

/**
 * @brief 对 items 中每一项渲染一次子节点。
 *
 * 每次迭代期间 answers[as] 绑定为当前项（迭代结束后恢复原值），
 * 因此子树中的公式可以引用它（例如 "=item.done"）。没有子节点时逐行输出各项文本。
 */
class ForEach final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "ForEach"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

}  // namespace pml::components
