#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pml::formula {

enum class TokenType : std::uint8_t {
  // 字面量
  Identifier,     // name, user.age
  String,         // "..."（"" 表示一个引号）
  Number,         // 42, 0.5, 1e3

  // 关键字（不区分大小写）
  KwAnd,
  KwOr,
  KwNot,
  KwTrue,
  KwFalse,

  // 运算符
  Plus,           // +
  Minus,          // -
  Star,           // *
  Slash,          // /
  Amp,            // &
  Eq,             // =
  Ne,             // <>
  Lt,             // <
  Gt,             // >
  Le,             // <=
  Ge,             // >=

  // 标点
  LParen,         // (
  RParen,         // )
  Comma,          // ,

  // 特殊
  Eof,
  Error,
};

struct Token {
  TokenType type{TokenType::Error};
  std::string value{};
  std::uint32_t column{1};

  [[nodiscard]] bool is(TokenType t) const noexcept { return type == t; }
  [[nodiscard]] bool is_comparison() const noexcept {
    return type >= TokenType::Eq && type <= TokenType::Ge;
  }
};

[[nodiscard]] constexpr std::string_view token_type_name(TokenType t) noexcept {
  switch (t) {
    case TokenType::Identifier: return "Identifier";
    case TokenType::String: return "String";
    case TokenType::Number: return "Number";
    case TokenType::KwAnd: return "AND";
    case TokenType::KwOr: return "OR";
    case TokenType::KwNot: return "NOT";
    case TokenType::KwTrue: return "TRUE";
    case TokenType::KwFalse: return "FALSE";
    case TokenType::Plus: return "+";
    case TokenType::Minus: return "-";
    case TokenType::Star: return "*";
    case TokenType::Slash: return "/";
    case TokenType::Amp: return "&";
    case TokenType::Eq: return "=";
    case TokenType::Ne: return "<>";
    case TokenType::Lt: return "<";
    case TokenType::Gt: return ">";
    case TokenType::Le: return "<=";
    case TokenType::Ge: return ">=";
    case TokenType::LParen: return "(";
    case TokenType::RParen: return ")";
    case TokenType::Comma: return ",";
    case TokenType::Eof: return "EOF";
    case TokenType::Error: return "Error";
  }
  return "Unknown";
}

}  // namespace pml::formula
