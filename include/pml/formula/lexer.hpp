#pragma once

#include "pml/formula/token.hpp"

#include <string_view>
#include <system_error>
#include <vector>

namespace pml::formula {

enum class lexer_errc : int {
  ok = 0,
  unterminated_string = 1,
  invalid_character = 2,
  invalid_number = 3,
};

const std::error_category& lexer_error_category() noexcept;
std::error_code make_error_code(lexer_errc e) noexcept;

struct LexerResult {
  std::vector<Token> tokens;
  std::error_code ec;
  std::uint32_t error_column{0};
  std::string error_message;
};

/**
 * @brief 公式词法分析器（输入不含前导 '='）。
 *
 * 支持:
 * - 标识符: count, user.age（'.' 分隔的路径作为一个记号）
 * - 字符串: "..."，内部 "" 表示一个双引号
 * - 数字: 42, 0.5, 1e3
 * - 关键字: AND OR NOT TRUE FALSE（不区分大小写）
 * - 运算符: + - * / & = <> < > <= >= ( ) ,
 */
class Lexer {
 public:
  explicit Lexer(std::string_view source) noexcept;

  [[nodiscard]] LexerResult tokenize() noexcept;

 private:
  [[nodiscard]] bool at_end() const noexcept;
  [[nodiscard]] char peek() const noexcept;
  [[nodiscard]] char peek_next() const noexcept;
  char advance() noexcept;
  void skip_whitespace() noexcept;

  Token scan_token() noexcept;
  Token scan_identifier() noexcept;
  Token scan_string() noexcept;
  Token scan_number() noexcept;

  Token make_token(TokenType type) const noexcept;
  Token make_token(TokenType type, std::string value) const noexcept;
  Token make_error(lexer_errc kind, std::string_view message) noexcept;

  std::string_view source_;
  std::size_t current_{0};
  std::size_t token_start_{0};
  lexer_errc last_error_kind_{lexer_errc::invalid_character};
};

}  // namespace pml::formula

namespace std {
template <>
struct is_error_code_enum<pml::formula::lexer_errc> : true_type {};
}  // namespace std
