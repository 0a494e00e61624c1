#pragma once

#include "pml/component/component.hpp"
#include "pml/render/context.hpp"

#include <string>
#include <string_view>

namespace pml::components {

/**
 * @brief 交互组件的公共部分。
 *
 * 公共 props：name（必填）、label（必填）、description、default、required、silent。
 *
 * resolve 流程：
 * 1. 附加 InputRequirement（记录当前作用域）；
 * 2. answers 中已有 name：使用该值；
 * 3. 否则若配置了 AnswerProvider：等待其答案，得到值则写入 answers；
 * 4. 仍无值：取 default 或类型默认值，写入 answers（只写不存在的条目）。
 *
 * render：silent 时不输出；无值且无 default 时输出 "{name}" 占位；否则输出 display()。
 */
class Ask : public Component {
 public:
  [[nodiscard]] bool has_resolve() const noexcept override { return true; }
  asio::awaitable<Value> resolve(const Props& props, RenderContext& ctx) const override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;

  // name/label 必填，其余公共字段可选，未声明的键放行。
  [[nodiscard]] static Schema base_schema();

 protected:
  [[nodiscard]] virtual std::string_view input_type() const noexcept = 0;
  // 补充类型相关字段（min/max/options）。
  virtual void describe(const Props& props, InputRequirement& requirement) const;
  // 外部答案的类型归一（例如数字字符串转数字）。
  [[nodiscard]] virtual Value coerce(const Value& answer) const;
  [[nodiscard]] virtual bool is_placeholder(const Props& props, const Value& value) const;
  [[nodiscard]] virtual std::string display(const Props& props, const Value& value) const;
};

class AskText final : public Ask {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "AskText"; }
  [[nodiscard]] const Schema* schema() const noexcept override;

 protected:
  [[nodiscard]] std::string_view input_type() const noexcept override { return "text"; }
};

class AskNumber final : public Ask {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "AskNumber"; }
  [[nodiscard]] const Schema* schema() const noexcept override;

 protected:
  [[nodiscard]] std::string_view input_type() const noexcept override { return "number"; }
  void describe(const Props& props, InputRequirement& requirement) const override;
  [[nodiscard]] Value coerce(const Value& answer) const override;
};

// 类型默认值 false；输出 "Yes" / "No"。
class AskConfirm final : public Ask {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "AskConfirm"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] std::optional<Value> implicit_default() const override { return Value(false); }

 protected:
  [[nodiscard]] std::string_view input_type() const noexcept override { return "confirm"; }
  [[nodiscard]] Value coerce(const Value& answer) const override;
  [[nodiscard]] bool is_placeholder(const Props& props, const Value& value) const override;
  [[nodiscard]] std::string display(const Props& props, const Value& value) const override;
};

/**
 * @brief 单选。options 为字符串数组或 {value, label, text} 对象数组；
 * default 必须是某个选项的 value；输出选中项的 text（缺省 label，再缺省 value）。
 */
class AskSelect final : public Ask {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "AskSelect"; }
  [[nodiscard]] const Schema* schema() const noexcept override;

 protected:
  [[nodiscard]] std::string_view input_type() const noexcept override { return "select"; }
  void describe(const Props& props, InputRequirement& requirement) const override;
  [[nodiscard]] std::string display(const Props& props, const Value& value) const override;
};

// 多选；类型默认值为空数组，输出各选中项文本（", " 分隔）。
class AskMultiSelect final : public Ask {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "AskMultiSelect"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] std::optional<Value> implicit_default() const override { return Value(Array{}); }

 protected:
  [[nodiscard]] std::string_view input_type() const noexcept override { return "multiselect"; }
  void describe(const Props& props, InputRequirement& requirement) const override;
  [[nodiscard]] bool is_placeholder(const Props& props, const Value& value) const override;
  [[nodiscard]] std::string display(const Props& props, const Value& value) const override;
};

// 评分：min 缺省 1，max 缺省 5，labels 为 {"1": "Poor", ...}；类型默认值 0。
class AskRating final : public Ask {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "AskRating"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] std::optional<Value> implicit_default() const override { return Value(0); }

 protected:
  [[nodiscard]] std::string_view input_type() const noexcept override { return "rating"; }
  void describe(const Props& props, InputRequirement& requirement) const override;
  [[nodiscard]] Value coerce(const Value& answer) const override;
  [[nodiscard]] bool is_placeholder(const Props& props, const Value& value) const override;
  [[nodiscard]] std::string display(const Props& props, const Value& value) const override;
};

}  // namespace pml::components
