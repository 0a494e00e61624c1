#pragma once

#include "pml/value/value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace pml {

/**
 * @brief 渲染期在节点边界收集的问题类别（category "pml.render"）。
 *
 * 以 warn_ 开头的是告警：默认不让渲染失败（见 RenderOptions）。
 */
enum class render_errc : int {
  ok = 0,

  // schema 校验
  invalid_type = 1,
  missing_required = 2,
  too_small = 3,
  too_big = 4,
  invalid_enum_value = 5,
  unrecognized_keys = 6,
  missing_schema = 7,

  // 运行期
  runtime_error = 20,
  unknown_component = 21,
  circular_reference = 22,
  max_depth_exceeded = 23,

  // 告警
  warn_missing_task = 100,
  warn_invalid_formula = 101,
};

const std::error_category& render_error_category() noexcept;
std::error_code make_error_code(render_errc e) noexcept;

// 错误码的稳定短名（"invalid_type" 等），用于日志与序列化。
[[nodiscard]] std::string_view render_errc_name(render_errc e) noexcept;

[[nodiscard]] bool is_warning(const std::error_code& ec) noexcept;

struct RenderError final {
  std::string component;
  std::optional<std::string> prop{};
  std::string message;
  std::error_code code{};
  Path path{};
  std::optional<Value> received{};
  std::optional<std::string> expected{};

  [[nodiscard]] bool is_warning() const noexcept { return pml::is_warning(code); }
};

// 单行描述："<component>: <message> (prop=..., expected=..., received=...)"。
[[nodiscard]] std::string describe(const RenderError& error);

}  // namespace pml

namespace std {
template <>
struct is_error_code_enum<pml::render_errc> : true_type {};
}  // namespace std
