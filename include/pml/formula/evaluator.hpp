#pragma once

#include "pml/formula/ast.hpp"
#include "pml/value/value.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace pml::formula {

enum class eval_errc : int {
  ok = 0,
  division_by_zero = 1,
  unknown_function = 2,
  wrong_arity = 3,
  invalid_operand = 4,
};

const std::error_category& eval_error_category() noexcept;
std::error_code make_error_code(eval_errc e) noexcept;

/**
 * @brief 公式求值器（纯函数：不修改 variables，不触发元素解析）。
 *
 * 约定：
 * - 标识符首段在 variables 中查找，其余段逐级索引；缺失得到 undefined，不是错误；
 * - 比较：数字按数值，字符串不区分大小写；blank（undefined/null）
 *   与 ""、0、FALSE 相等；类型不同则不相等，且 < > <= >= 均为假；
 * - 运行期错误（除零、未知函数、参数个数不对、无法转成数字）通过错误码返回。
 */
class Evaluator {
 public:
  explicit Evaluator(const Object& variables) noexcept : variables_(variables) {}

  [[nodiscard]] std::error_code evaluate(const Expr& expr, Value& out) const noexcept;

 private:
  std::error_code eval_identifier(const Identifier& id, Value& out) const noexcept;
  std::error_code eval_unary(const Unary& u, Value& out) const noexcept;
  std::error_code eval_binary(const Binary& b, Value& out) const noexcept;
  std::error_code eval_call(const Call& call, Value& out) const noexcept;

  const Object& variables_;
};

// 比较两个已求值的操作数（op 必须是比较运算符）。
[[nodiscard]] bool compare(BinaryOp op, const Value& lhs, const Value& rhs) noexcept;

struct FormulaResult {
  bool value{false};
  std::error_code ec;            // lexer / parser / eval 类别之一
  std::uint32_t error_column{0};
  std::string error_message;

  // 词法或语法错误（公式本身写错），区别于运行期错误。
  [[nodiscard]] bool syntax_error() const noexcept;
};

/**
 * @brief 求值条件字符串。
 *
 * - 不以 '=' 开头：普通真值判断（非空即真）；
 * - 以 '=' 开头：按公式解析求值，结果按真值规则转为 bool；
 * - 任何错误都使结果为 false，错误信息留在返回值中供调用方决定是否上报。
 */
[[nodiscard]] FormulaResult evaluate_formula(std::string_view formula, const Object& variables) noexcept;

}  // namespace pml::formula

namespace std {
template <>
struct is_error_code_enum<pml::formula::eval_errc> : true_type {};
}  // namespace std
