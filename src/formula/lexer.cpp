#include "pml/formula/lexer.hpp"

#include <cctype>

namespace pml::formula {

namespace {

class LexerErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "pml.formula.lexer"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<lexer_errc>(ev)) {
      case lexer_errc::ok: return "success";
      case lexer_errc::unterminated_string: return "unterminated string literal";
      case lexer_errc::invalid_character: return "invalid character";
      case lexer_errc::invalid_number: return "invalid number literal";
    }
    return "unknown lexer error";
  }
};

const LexerErrorCategory kLexerErrorCategory{};

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

TokenType keyword_type(std::string_view text) noexcept {
  if (iequals(text, "AND")) return TokenType::KwAnd;
  if (iequals(text, "OR")) return TokenType::KwOr;
  if (iequals(text, "NOT")) return TokenType::KwNot;
  if (iequals(text, "TRUE")) return TokenType::KwTrue;
  if (iequals(text, "FALSE")) return TokenType::KwFalse;
  return TokenType::Identifier;
}

bool is_ident_start(char c) noexcept {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char c) noexcept {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

}  // namespace

const std::error_category& lexer_error_category() noexcept { return kLexerErrorCategory; }

std::error_code make_error_code(lexer_errc e) noexcept {
  return {static_cast<int>(e), kLexerErrorCategory};
}

Lexer::Lexer(std::string_view source) noexcept : source_(source) {}

LexerResult Lexer::tokenize() noexcept {
  LexerResult result;

  while (true) {
    skip_whitespace();
    if (at_end()) {
      break;
    }

    token_start_ = current_;
    Token token = scan_token();
    if (token.type == TokenType::Error) {
      result.ec = make_error_code(last_error_kind_);
      result.error_column = token.column;
      result.error_message = token.value;
      return result;
    }
    result.tokens.push_back(std::move(token));
  }

  token_start_ = current_;
  result.tokens.push_back(make_token(TokenType::Eof, {}));
  return result;
}

bool Lexer::at_end() const noexcept { return current_ >= source_.size(); }

char Lexer::peek() const noexcept {
  if (at_end()) return '\0';
  return source_[current_];
}

char Lexer::peek_next() const noexcept {
  if (current_ + 1 >= source_.size()) return '\0';
  return source_[current_ + 1];
}

char Lexer::advance() noexcept { return source_[current_++]; }

void Lexer::skip_whitespace() noexcept {
  while (!at_end()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else {
      break;
    }
  }
}

Token Lexer::scan_token() noexcept {
  const char c = advance();

  switch (c) {
    case '+': return make_token(TokenType::Plus);
    case '-': return make_token(TokenType::Minus);
    case '*': return make_token(TokenType::Star);
    case '/': return make_token(TokenType::Slash);
    case '&': return make_token(TokenType::Amp);
    case '=': return make_token(TokenType::Eq);
    case '(': return make_token(TokenType::LParen);
    case ')': return make_token(TokenType::RParen);
    case ',': return make_token(TokenType::Comma);
    case '<':
      if (peek() == '=') {
        advance();
        return make_token(TokenType::Le);
      }
      if (peek() == '>') {
        advance();
        return make_token(TokenType::Ne);
      }
      return make_token(TokenType::Lt);
    case '>':
      if (peek() == '=') {
        advance();
        return make_token(TokenType::Ge);
      }
      return make_token(TokenType::Gt);
    case '"':
      return scan_string();
    default:
      break;
  }

  if (is_ident_start(c)) {
    --current_;
    return scan_identifier();
  }

  // 数字：不含符号（负号由语法层的一元减号处理）
  if (std::isdigit(static_cast<unsigned char>(c)) ||
      (c == '.' && std::isdigit(static_cast<unsigned char>(peek())))) {
    --current_;
    return scan_number();
  }

  return make_error(lexer_errc::invalid_character, std::string("unexpected character: ") + c);
}

Token Lexer::scan_identifier() noexcept {
  const std::size_t start = current_;
  while (!at_end()) {
    if (is_ident_char(peek())) {
      advance();
      continue;
    }
    // 路径分隔：'.' 后必须紧跟标识符字符
    if (peek() == '.' && is_ident_char(peek_next())) {
      advance();
      continue;
    }
    break;
  }

  const std::string_view text = source_.substr(start, current_ - start);
  return make_token(keyword_type(text), std::string(text));
}

Token Lexer::scan_string() noexcept {
  std::string value;
  while (!at_end()) {
    const char c = advance();
    if (c != '"') {
      value += c;
      continue;
    }
    if (peek() == '"') {
      advance();
      value += '"';
      continue;
    }
    return make_token(TokenType::String, std::move(value));
  }
  return make_error(lexer_errc::unterminated_string, "unterminated string");
}

Token Lexer::scan_number() noexcept {
  const std::size_t start = current_;

  while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
    advance();
  }
  if (peek() == '.') {
    advance();
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return make_error(lexer_errc::invalid_number, "exponent has no digits");
    }
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }
  if (is_ident_start(peek())) {
    return make_error(lexer_errc::invalid_number, "identifier cannot start with a digit");
  }

  return make_token(TokenType::Number, std::string(source_.substr(start, current_ - start)));
}

Token Lexer::make_token(TokenType type) const noexcept {
  return Token{type, std::string(source_.substr(token_start_, current_ - token_start_)),
               static_cast<std::uint32_t>(token_start_ + 1)};
}

Token Lexer::make_token(TokenType type, std::string value) const noexcept {
  return Token{type, std::move(value), static_cast<std::uint32_t>(token_start_ + 1)};
}

Token Lexer::make_error(lexer_errc kind, std::string_view message) noexcept {
  last_error_kind_ = kind;
  return Token{TokenType::Error, std::string(message), static_cast<std::uint32_t>(token_start_ + 1)};
}

}  // namespace pml::formula
