#include "pml/formula/parser.hpp"

#include "pml/formula/lexer.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace pml::formula {

namespace {

class ParserErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "pml.formula.parser"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<parser_errc>(ev)) {
      case parser_errc::ok: return "success";
      case parser_errc::unexpected_token: return "unexpected token";
      case parser_errc::expected_expression: return "expected expression";
      case parser_errc::expected_rparen: return "expected ')'";
      case parser_errc::chained_comparison: return "comparison operators cannot be chained";
      case parser_errc::trailing_input: return "unexpected input after expression";
      case parser_errc::empty_formula: return "empty formula";
      case parser_errc::nesting_too_deep: return "formula nests too deeply";
      case parser_errc::formula_too_long: return "formula too long";
    }
    return "unknown parser error";
  }
};

const ParserErrorCategory kParserErrorCategory{};

ExprPtr make_expr(std::uint32_t column, auto node) {
  auto e = std::make_unique<Expr>();
  e->node = std::move(node);
  e->column = column;
  return e;
}

std::string to_upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::vector<std::string> split_path(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const auto dot = text.find('.', start);
    out.emplace_back(text.substr(start, dot - start));
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return out;
}

BinaryOp comparison_op(TokenType t) noexcept {
  switch (t) {
    case TokenType::Ne: return BinaryOp::Ne;
    case TokenType::Lt: return BinaryOp::Lt;
    case TokenType::Gt: return BinaryOp::Gt;
    case TokenType::Le: return BinaryOp::Le;
    case TokenType::Ge: return BinaryOp::Ge;
    default: return BinaryOp::Eq;
  }
}

}  // namespace

const std::error_category& parser_error_category() noexcept { return kParserErrorCategory; }

std::error_code make_error_code(parser_errc e) noexcept {
  return {static_cast<int>(e), kParserErrorCategory};
}

Parser::Parser(std::vector<Token> tokens) noexcept : tokens_(std::move(tokens)) {
  if (tokens_.empty() || !tokens_.back().is(TokenType::Eof)) {
    tokens_.push_back(Token{TokenType::Eof, {}, 1});
  }
}

ParseResult Parser::parse() noexcept {
  ParseResult result;

  if (peek().is(TokenType::Eof)) {
    error_at(parser_errc::empty_formula, peek(), "empty formula");
  } else if (tokens_.size() > kMaxFormulaTokens + 1) {
    error_at(parser_errc::formula_too_long, tokens_[kMaxFormulaTokens],
             "formula has more than " + std::to_string(kMaxFormulaTokens) + " tokens");
  } else {
    auto expr = parse_or();
    if (!had_error_ && !at_end()) {
      error_at(parser_errc::trailing_input, peek(),
               "unexpected '" + peek().value + "' after expression");
    }
    if (!had_error_) {
      result.expr = std::move(expr);
    }
  }

  result.ec = ec_;
  result.error_column = error_column_;
  result.error_message = error_message_;
  return result;
}

bool Parser::at_end() const noexcept { return peek().is(TokenType::Eof); }

const Token& Parser::peek() const noexcept { return tokens_[current_]; }

const Token& Parser::peek_next() const noexcept {
  if (current_ + 1 >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[current_ + 1];
}

const Token& Parser::previous() const noexcept { return tokens_[current_ - 1]; }

const Token& Parser::advance() noexcept {
  if (!at_end()) {
    ++current_;
  }
  return previous();
}

bool Parser::check(TokenType type) const noexcept { return peek().is(type); }

bool Parser::match(TokenType type) noexcept {
  if (!check(type)) {
    return false;
  }
  advance();
  return true;
}

Parser::NestingGuard::NestingGuard(Parser& p) noexcept : parser(p) {
  if (++parser.depth_ > kMaxNestingDepth) {
    parser.error_at(parser_errc::nesting_too_deep, parser.peek(),
                    "nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels");
  }
}

ExprPtr Parser::parse_or() noexcept {
  const NestingGuard guard(*this);
  if (!guard.ok()) {
    return nullptr;
  }
  auto lhs = parse_and();
  while (!had_error_ && check(TokenType::KwOr) && !peek_next().is(TokenType::LParen)) {
    const auto column = advance().column;
    auto rhs = parse_and();
    if (had_error_) {
      return nullptr;
    }
    lhs = make_expr(column, Binary{BinaryOp::Or, std::move(lhs), std::move(rhs)});
  }
  return lhs;
}

ExprPtr Parser::parse_and() noexcept {
  auto lhs = parse_not();
  while (!had_error_ && check(TokenType::KwAnd) && !peek_next().is(TokenType::LParen)) {
    const auto column = advance().column;
    auto rhs = parse_not();
    if (had_error_) {
      return nullptr;
    }
    lhs = make_expr(column, Binary{BinaryOp::And, std::move(lhs), std::move(rhs)});
  }
  return lhs;
}

ExprPtr Parser::parse_not() noexcept {
  // NOT(...) 按函数调用处理，由 parse_primary 负责
  if (check(TokenType::KwNot) && !peek_next().is(TokenType::LParen)) {
    const NestingGuard guard(*this);
    if (!guard.ok()) {
      return nullptr;
    }
    const auto column = advance().column;
    auto operand = parse_not();
    if (had_error_) {
      return nullptr;
    }
    return make_expr(column, Unary{UnaryOp::Not, std::move(operand)});
  }
  return parse_comparison();
}

ExprPtr Parser::parse_comparison() noexcept {
  auto lhs = parse_additive();
  if (had_error_ || !peek().is_comparison()) {
    return lhs;
  }
  const Token& op = advance();
  const auto column = op.column;
  const auto kind = comparison_op(op.type);
  auto rhs = parse_additive();
  if (had_error_) {
    return nullptr;
  }
  if (peek().is_comparison()) {
    error_at(parser_errc::chained_comparison, peek(), "comparison operators cannot be chained");
    return nullptr;
  }
  return make_expr(column, Binary{kind, std::move(lhs), std::move(rhs)});
}

ExprPtr Parser::parse_additive() noexcept {
  auto lhs = parse_multiplicative();
  while (!had_error_ && (check(TokenType::Plus) || check(TokenType::Minus) || check(TokenType::Amp))) {
    const Token& op = advance();
    const auto column = op.column;
    const auto kind = op.is(TokenType::Plus)    ? BinaryOp::Add
                      : op.is(TokenType::Minus) ? BinaryOp::Sub
                                                : BinaryOp::Concat;
    auto rhs = parse_multiplicative();
    if (had_error_) {
      return nullptr;
    }
    lhs = make_expr(column, Binary{kind, std::move(lhs), std::move(rhs)});
  }
  return lhs;
}

ExprPtr Parser::parse_multiplicative() noexcept {
  auto lhs = parse_unary();
  while (!had_error_ && (check(TokenType::Star) || check(TokenType::Slash))) {
    const Token& op = advance();
    const auto column = op.column;
    const auto kind = op.is(TokenType::Star) ? BinaryOp::Mul : BinaryOp::Div;
    auto rhs = parse_unary();
    if (had_error_) {
      return nullptr;
    }
    lhs = make_expr(column, Binary{kind, std::move(lhs), std::move(rhs)});
  }
  return lhs;
}

ExprPtr Parser::parse_unary() noexcept {
  if (check(TokenType::Minus) || check(TokenType::Plus)) {
    const NestingGuard guard(*this);
    if (!guard.ok()) {
      return nullptr;
    }
    if (match(TokenType::Plus)) {
      return parse_unary();
    }
    const auto column = advance().column;
    auto operand = parse_unary();
    if (had_error_) {
      return nullptr;
    }
    return make_expr(column, Unary{UnaryOp::Negate, std::move(operand)});
  }
  return parse_primary();
}

ExprPtr Parser::parse_primary() noexcept {
  const Token& tok = peek();

  switch (tok.type) {
    case TokenType::Number: {
      advance();
      const char* first = tok.value.data();
      char* last = nullptr;
      const double v = std::strtod(first, &last);
      return make_expr(tok.column, Literal{Value(v)});
    }
    case TokenType::String:
      advance();
      return make_expr(tok.column, Literal{Value(tok.value)});
    case TokenType::KwTrue:
    case TokenType::KwFalse:
    case TokenType::KwAnd:
    case TokenType::KwOr:
    case TokenType::KwNot: {
      if (peek_next().is(TokenType::LParen)) {
        advance();
        return parse_call(to_upper(tok.value), tok.column);
      }
      if (tok.is(TokenType::KwTrue) || tok.is(TokenType::KwFalse)) {
        advance();
        return make_expr(tok.column, Literal{Value(tok.is(TokenType::KwTrue))});
      }
      error_at(parser_errc::unexpected_token, tok, "unexpected keyword '" + tok.value + "'");
      return nullptr;
    }
    case TokenType::Identifier: {
      advance();
      if (check(TokenType::LParen)) {
        return parse_call(to_upper(tok.value), tok.column);
      }
      return make_expr(tok.column, Identifier{split_path(tok.value)});
    }
    case TokenType::LParen: {
      advance();
      auto inner = parse_or();
      if (had_error_) {
        return nullptr;
      }
      if (!match(TokenType::RParen)) {
        error_at(parser_errc::expected_rparen, peek(), "expected ')'");
        return nullptr;
      }
      return inner;
    }
    case TokenType::Eof:
      error_at(parser_errc::expected_expression, tok, "unexpected end of formula");
      return nullptr;
    default:
      error_at(parser_errc::expected_expression, tok, "unexpected '" + tok.value + "'");
      return nullptr;
  }
}

ExprPtr Parser::parse_call(std::string name, std::uint32_t column) noexcept {
  // 当前记号为 '('
  advance();
  Call call{std::move(name), {}};

  if (match(TokenType::RParen)) {
    return make_expr(column, std::move(call));
  }

  while (true) {
    auto arg = parse_or();
    if (had_error_) {
      return nullptr;
    }
    call.args.push_back(std::move(arg));
    if (match(TokenType::Comma)) {
      continue;
    }
    if (match(TokenType::RParen)) {
      break;
    }
    error_at(parser_errc::expected_rparen, peek(), "expected ',' or ')' in argument list");
    return nullptr;
  }
  return make_expr(column, std::move(call));
}

void Parser::error_at(parser_errc code, const Token& token, std::string_view message) noexcept {
  if (had_error_) {
    return;
  }
  had_error_ = true;
  ec_ = make_error_code(code);
  error_column_ = token.column;
  error_message_ = std::string(message);
}

ParseResult parse(std::string_view source) noexcept {
  Lexer lexer(source);
  auto lexed = lexer.tokenize();
  if (lexed.ec) {
    ParseResult result;
    result.ec = lexed.ec;
    result.error_column = lexed.error_column;
    result.error_message = std::move(lexed.error_message);
    return result;
  }
  Parser parser(std::move(lexed.tokens));
  return parser.parse();
}

}  // namespace pml::formula
