#pragma once

#include "pml/element/element.hpp"
#include "pml/value/value.hpp"

#include <asio/awaitable.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pml {

class RenderContext;
class Schema;

/**
 * @brief 组件收到的属性视图：已物化的 props + 原始 children。
 *
 * 只在一次 resolve/render 调用期间有效（持有引用）。
 */
class Props final {
 public:
  Props(const Object& values, const Array& children) noexcept : values_(values), children_(children) {}

  // 缺失时返回 undefined。
  [[nodiscard]] const Value& operator[](std::string_view key) const noexcept;
  [[nodiscard]] bool has(std::string_view key) const noexcept;

  [[nodiscard]] std::string string_or(std::string_view key, std::string_view fallback) const;
  [[nodiscard]] double number_or(std::string_view key, double fallback) const noexcept;
  [[nodiscard]] bool bool_or(std::string_view key, bool fallback) const noexcept;

  [[nodiscard]] const Object& values() const noexcept { return values_; }
  [[nodiscard]] const Array& children() const noexcept { return children_; }

 private:
  const Object& values_;
  const Array& children_;
};

/**
 * @brief 组件协议（引擎只通过这些虚函数与组件交互）。
 *
 * 两阶段：
 * - resolve（可选，has_resolve() 为 true 时调用）：可挂起，产生“解析值”；
 *   同一渲染过程中按元素身份记忆，其他元素可通过 DeferredRef 引用它；
 * - render：由 props 与解析值生成节点（文本/元素/数组）。
 *
 * 组件必须是无状态的：同一实例会在多个渲染、多个位置复用。
 * 可以抛出 std::exception 派生异常，引擎在节点边界捕获并回退到子节点。
 */
class Component {
 public:
  Component() noexcept;
  virtual ~Component() = default;

  Component(const Component&) = delete;
  Component& operator=(const Component&) = delete;

  [[nodiscard]] const char* brand() const noexcept { return brand_; }

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  // 无 schema 时返回 nullptr（strict_schemas 下记 missing_schema）。
  [[nodiscard]] virtual const Schema* schema() const noexcept { return nullptr; }

  [[nodiscard]] virtual bool has_resolve() const noexcept { return false; }
  virtual asio::awaitable<Value> resolve(const Props& props, RenderContext& ctx) const;

  // 默认实现：渲染解析值的字符串形式。
  [[nodiscard]] virtual Node render(const Props& props, const Value& resolved, RenderContext& ctx) const;

  // 交互组件在没有显式 default 时使用的类型默认值。
  [[nodiscard]] virtual std::optional<Value> implicit_default() const { return std::nullopt; }

  // 为子树引入的命名作用域（nullopt 表示不引入）。
  [[nodiscard]] virtual std::optional<std::string> scope(const Props& props) const;

  // 渲染子树期间临时写入 answers 的绑定；子树结束后恢复原值。
  [[nodiscard]] virtual Object bindings(const Props& props) const;

 private:
  const char* brand_;
};

// 按 brand 值判断，可识别同进程内另一份库副本创建的组件。
[[nodiscard]] bool is_component_class(const Component* component) noexcept;

}  // namespace pml
