#pragma once

#include "pml/formula/ast.hpp"
#include "pml/formula/token.hpp"

#include <cstddef>
#include <string_view>
#include <system_error>
#include <vector>

namespace pml::formula {

enum class parser_errc : int {
  ok = 0,
  unexpected_token = 1,
  expected_expression = 2,
  expected_rparen = 3,
  chained_comparison = 4,
  trailing_input = 5,
  empty_formula = 6,
  nesting_too_deep = 7,
  formula_too_long = 8,
};

// 括号、函数调用、NOT 与一元正负号的嵌套上限
inline constexpr std::size_t kMaxNestingDepth = 256;
// 记号数上限（不含结尾 Eof）；同时限制了左结合运算链生成的 AST 深度
inline constexpr std::size_t kMaxFormulaTokens = 4096;

const std::error_category& parser_error_category() noexcept;
std::error_code make_error_code(parser_errc e) noexcept;

struct ParseResult {
  ExprPtr expr;
  std::error_code ec;
  std::uint32_t error_column{0};
  std::string error_message;
};

/**
 * @brief 公式语法分析器（递归下降）。
 *
 * 优先级（低 -> 高）：
 *   OR < AND < NOT < 比较（= <> < > <= >=，不可连用）
 *      < + - & < * / < 一元负号 < 字面量 / 标识符 / 调用 / 括号
 *
 * AND/OR/NOT 既是中缀/前缀关键字，也可写成函数调用形式 AND(a, b)。
 */
class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) noexcept;

  [[nodiscard]] ParseResult parse() noexcept;

 private:
  [[nodiscard]] bool at_end() const noexcept;
  [[nodiscard]] const Token& peek() const noexcept;
  [[nodiscard]] const Token& peek_next() const noexcept;
  [[nodiscard]] const Token& previous() const noexcept;
  const Token& advance() noexcept;
  [[nodiscard]] bool check(TokenType type) const noexcept;
  bool match(TokenType type) noexcept;

  ExprPtr parse_or() noexcept;
  ExprPtr parse_and() noexcept;
  ExprPtr parse_not() noexcept;
  ExprPtr parse_comparison() noexcept;
  ExprPtr parse_additive() noexcept;
  ExprPtr parse_multiplicative() noexcept;
  ExprPtr parse_unary() noexcept;
  ExprPtr parse_primary() noexcept;
  ExprPtr parse_call(std::string name, std::uint32_t column) noexcept;

  void error_at(parser_errc code, const Token& token, std::string_view message) noexcept;

  // 进入一层嵌套；超过上限时记录错误并返回 false
  struct NestingGuard {
    explicit NestingGuard(Parser& p) noexcept;
    ~NestingGuard() { --parser.depth_; }
    [[nodiscard]] bool ok() const noexcept { return parser.depth_ <= kMaxNestingDepth; }
    Parser& parser;
  };

  std::vector<Token> tokens_;
  std::size_t current_{0};
  std::size_t depth_{0};

  std::error_code ec_;
  std::uint32_t error_column_{0};
  std::string error_message_;
  bool had_error_{false};
};

/**
 * @brief 词法 + 语法一步完成（输入不含前导 '='）。
 *
 * 词法错误以 lexer 类别的错误码返回，语法错误以 parser 类别返回。
 */
[[nodiscard]] ParseResult parse(std::string_view source) noexcept;

}  // namespace pml::formula

namespace std {
template <>
struct is_error_code_enum<pml::formula::parser_errc> : true_type {};
}  // namespace std
