#pragma once

#include "pml/component/component.hpp"

namespace pml::components {

// 以下组件只向 post_execution 追加动作，自身不输出文本。

// file（必填）、editor。
class ReviewFile final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "ReviewFile"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

// url（必填）、browser。
class OpenUrl final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "OpenUrl"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

// command（必填）、cwd、env（字符串值对象）。
class RunCommand final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "RunCommand"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

}  // namespace pml::components
