#pragma once

#include "pml/render/error.hpp"
#include "pml/value/value.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pml {

// 属性允许的取值类型（位掩码，可组合）。
using KindMask = std::uint16_t;

namespace kind {
inline constexpr KindMask string = 1U << 0;
inline constexpr KindMask number = 1U << 1;
inline constexpr KindMask boolean = 1U << 2;
inline constexpr KindMask array = 1U << 3;
inline constexpr KindMask object = 1U << 4;
inline constexpr KindMask element = 1U << 5;
inline constexpr KindMask null = 1U << 6;
inline constexpr KindMask any = 0xFFFFU;
}  // namespace kind

// undefined 返回 0。
[[nodiscard]] KindMask kind_of(const Value& v) noexcept;
// 例："string | number"。
[[nodiscard]] std::string describe_kinds(KindMask mask);

struct FieldSpec final {
  std::string name;
  KindMask kinds{kind::any};
  bool required{false};
  Array allowed{};                    // 非空时值必须等于其中之一
  std::optional<double> min{};        // number: 值；string: 长度；array: 元素个数
  std::optional<double> max{};
  KindMask item_kinds{kind::any};     // array 元素类型
};

/**
 * @brief 组件属性 schema（声明式，渲染前对已物化的 props 校验）。
 *
 * 用法：
 *   Schema{}.required("name", kind::string).optional("min", kind::number).range("min", 0, {});
 *
 * 说明：
 * - 默认 passthrough：未声明的键原样保留；strict() 后未声明的键报 unrecognized_keys；
 * - refine() 追加跨字段约束，在逐字段校验全部通过后才执行。
 */
class Schema final {
 public:
  using Predicate = std::function<bool(const Object&)>;

  Schema& required(std::string name, KindMask kinds);
  Schema& optional(std::string name, KindMask kinds);
  Schema& one_of(std::string_view name, Array allowed);
  Schema& range(std::string_view name, std::optional<double> min, std::optional<double> max);
  Schema& items(std::string_view name, KindMask kinds);
  Schema& strict(bool on = true) noexcept;
  Schema& refine(std::string prop, render_errc code, std::string message, Predicate check);

  [[nodiscard]] const FieldSpec* field(std::string_view name) const noexcept;
  [[nodiscard]] const std::vector<FieldSpec>& fields() const noexcept { return fields_; }
  [[nodiscard]] bool is_strict() const noexcept { return strict_; }

  // 返回全部问题（为空表示通过）。
  [[nodiscard]] std::vector<RenderError> validate(std::string_view component, const Object& props) const;

 private:
  struct Refinement {
    std::string prop;
    render_errc code;
    std::string message;
    Predicate check;
  };

  FieldSpec& field_or_add_(std::string_view name);

  std::vector<FieldSpec> fields_{};
  std::vector<Refinement> refinements_{};
  bool strict_{false};
};

}  // namespace pml
