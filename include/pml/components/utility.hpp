#pragma once

#include "pml/component/component.hpp"

namespace pml::components {

// 输出 env.runtime 中的运行环境事实（渲染开始时采集一次）。

class Hostname final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Hostname"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

class Username final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Username"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

class Cwd final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Cwd"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

// format: iso（缺省，"<date>T<time>"）/ date / time / unix（毫秒）。
class Timestamp final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Timestamp"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

}  // namespace pml::components
