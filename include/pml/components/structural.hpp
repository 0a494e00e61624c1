#pragma once

#include "pml/component/component.hpp"

#include <string>
#include <string_view>

namespace pml::components {

/**
 * @brief 文档根：name / description / version / tags / bare。
 *
 * - 有 name 时为子树引入同名作用域；
 * - 非 bare 且子节点（穿透 Fragment）中没有 Task 时记 warn_missing_task；
 * - 输出即子节点。
 */
class Prompt final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Prompt"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
  [[nodiscard]] std::optional<std::string> scope(const Props& props) const override;
};

// 以固定标签包裹子节点的结构组件（xml / markdown / none 由 delimiter 决定）。
class Wrapper : public Component {
 public:
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;

 protected:
  [[nodiscard]] virtual std::string tag(const Props& props) const = 0;
  // 包裹前对内容的加工（默认原样）。
  [[nodiscard]] virtual Node content(const Props& props, const RenderContext& ctx) const;
};

class Role final : public Wrapper {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Role"; }

 protected:
  [[nodiscard]] std::string tag(const Props&) const override { return "role"; }
};

class Task final : public Wrapper {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Task"; }

 protected:
  [[nodiscard]] std::string tag(const Props&) const override { return "task"; }
};

class Context final : public Wrapper {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Context"; }

 protected:
  [[nodiscard]] std::string tag(const Props&) const override { return "context"; }
};

/**
 * @brief 带名字的分节：标签取 name（缺省 "section"），markdown 下标题优先取 title。
 *
 * 有 name 时引入同名作用域。
 */
class Section final : public Wrapper {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Section"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
  [[nodiscard]] std::optional<std::string> scope(const Props& props) const override;

 protected:
  [[nodiscard]] std::string tag(const Props& props) const override;
};

// type: must / should / must-not；内容前加 "MUST: " 等前缀。
class Constraint final : public Wrapper {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Constraint"; }
  [[nodiscard]] const Schema* schema() const noexcept override;

 protected:
  [[nodiscard]] std::string tag(const Props&) const override { return "constraint"; }
  [[nodiscard]] Node content(const Props& props, const RenderContext& ctx) const override;
};

// type 给出输出格式名（如 json、markdown）；内容为 "Output format: <type>" 加子节点。
class Format final : public Wrapper {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Format"; }
  [[nodiscard]] const Schema* schema() const noexcept override;

 protected:
  [[nodiscard]] std::string tag(const Props&) const override { return "format"; }
  [[nodiscard]] Node content(const Props& props, const RenderContext& ctx) const override;
};

}  // namespace pml::components
