#pragma once

#include "pml/value/value.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pml::formula {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

enum class BinaryOp : std::uint8_t {
  Or,
  And,
  Eq,
  Ne,
  Lt,
  Gt,
  Le,
  Ge,
  Add,
  Sub,
  Concat,
  Mul,
  Div,
};

enum class UnaryOp : std::uint8_t {
  Not,
  Negate,
};

// 字面量：数字 / 字符串 / TRUE / FALSE
struct Literal {
  Value value;
};

/**
 * @brief 变量引用
 *
 * 格式：name 或 a.b.c；首段在 answers 中查找，其余段逐级索引对象。
 */
struct Identifier {
  std::vector<std::string> path;
};

struct Unary {
  UnaryOp op;
  ExprPtr operand;
};

struct Binary {
  BinaryOp op;
  ExprPtr lhs;
  ExprPtr rhs;
};

/**
 * @brief 函数调用
 *
 * 名称统一存为大写（函数名不区分大小写）。
 */
struct Call {
  std::string name;
  std::vector<ExprPtr> args;
};

struct Expr {
  std::variant<Literal, Identifier, Unary, Binary, Call> node;
  std::uint32_t column{1};
};

}  // namespace pml::formula
