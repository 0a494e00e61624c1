#include "pml/formula/evaluator.hpp"

#include "pml/formula/lexer.hpp"
#include "pml/formula/parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace pml::formula {

namespace {

class EvalErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "pml.formula.eval"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<eval_errc>(ev)) {
      case eval_errc::ok: return "success";
      case eval_errc::division_by_zero: return "division by zero";
      case eval_errc::unknown_function: return "unknown function";
      case eval_errc::wrong_arity: return "wrong number of arguments";
      case eval_errc::invalid_operand: return "operand is not a number";
    }
    return "unknown evaluation error";
  }
};

const EvalErrorCategory kEvalErrorCategory{};

bool is_blank(const Value& v) noexcept { return v.is_nullish(); }

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

// 去掉首尾空白，并把内部连续空格压成一个。
std::string trim_spaces(std::string_view s) {
  std::string out;
  bool pending_space = false;
  for (const char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out += ' ';
      pending_space = false;
    }
    out += c;
  }
  return out;
}

// 算术上下文中的数值转换：blank -> 0，bool -> 0/1，数字串按数值解析。
std::error_code to_number(const Value& v, double& out) noexcept {
  if (const auto d = v.as_number()) {
    out = *d;
    return {};
  }
  if (is_blank(v)) {
    out = 0.0;
    return {};
  }
  if (const auto b = v.as_bool()) {
    out = *b ? 1.0 : 0.0;
    return {};
  }
  if (const auto s = v.as_string()) {
    const std::string text = trim_spaces(*s);
    if (text.empty()) {
      out = 0.0;
      return {};
    }
    char* end = nullptr;
    const double d = std::strtod(text.c_str(), &end);
    if (end == text.c_str() + text.size()) {
      out = d;
      return {};
    }
  }
  return make_error_code(eval_errc::invalid_operand);
}

// blank 参与比较时取对方类型的“零值”。
Value blank_as(const Value& other) {
  if (other.is<double>()) return Value(0.0);
  if (other.is<std::string>()) return Value(std::string{});
  if (other.is<bool>()) return Value(false);
  return other.is_nullish() ? other : Value{};
}

int three_way(double a, double b) noexcept { return a < b ? -1 : (a > b ? 1 : 0); }

bool apply_order(BinaryOp op, int cmp) noexcept {
  switch (op) {
    case BinaryOp::Eq: return cmp == 0;
    case BinaryOp::Ne: return cmp != 0;
    case BinaryOp::Lt: return cmp < 0;
    case BinaryOp::Gt: return cmp > 0;
    case BinaryOp::Le: return cmp <= 0;
    case BinaryOp::Ge: return cmp >= 0;
    default: return false;
  }
}

std::error_code arity(const Call& call, std::size_t min, std::size_t max) noexcept {
  if (call.args.size() < min || call.args.size() > max) {
    return make_error_code(eval_errc::wrong_arity);
  }
  return {};
}

// 展开数组参数并跳过 blank（SUM/MIN/MAX 的参数语义）。
std::error_code collect_numbers(const Value& v, std::vector<double>& out) noexcept {
  if (is_blank(v)) {
    return {};
  }
  if (const auto* arr = v.get_if<Array>()) {
    for (const auto& item : *arr) {
      if (auto ec = collect_numbers(item, out)) {
        return ec;
      }
    }
    return {};
  }
  double d = 0.0;
  if (auto ec = to_number(v, d)) {
    return ec;
  }
  out.push_back(d);
  return {};
}

bool loose_equals(const Value& a, const Value& b) noexcept { return compare(BinaryOp::Eq, a, b); }

}  // namespace

const std::error_category& eval_error_category() noexcept { return kEvalErrorCategory; }

std::error_code make_error_code(eval_errc e) noexcept {
  return {static_cast<int>(e), kEvalErrorCategory};
}

bool compare(BinaryOp op, const Value& lhs_in, const Value& rhs_in) noexcept {
  if (is_blank(lhs_in) && is_blank(rhs_in)) {
    return apply_order(op, 0);
  }
  const Value lhs = is_blank(lhs_in) ? blank_as(rhs_in) : lhs_in;
  const Value rhs = is_blank(rhs_in) ? blank_as(lhs_in) : rhs_in;

  if (const auto a = lhs.as_number()) {
    if (const auto b = rhs.as_number()) {
      if (std::isnan(*a) || std::isnan(*b)) {
        return op == BinaryOp::Ne;
      }
      return apply_order(op, three_way(*a, *b));
    }
  }
  if (const auto a = lhs.as_string()) {
    if (const auto b = rhs.as_string()) {
      const auto la = lower(*a);
      const auto lb = lower(*b);
      return apply_order(op, la < lb ? -1 : (la > lb ? 1 : 0));
    }
  }
  if (const auto a = lhs.as_bool()) {
    if (const auto b = rhs.as_bool()) {
      return apply_order(op, static_cast<int>(*a) - static_cast<int>(*b));
    }
  }

  // 数组 / 对象 / 混合类型：只支持结构相等判断
  if (op == BinaryOp::Eq) {
    return lhs == rhs;
  }
  if (op == BinaryOp::Ne) {
    return !(lhs == rhs);
  }
  return false;
}

std::error_code Evaluator::evaluate(const Expr& expr, Value& out) const noexcept {
  return std::visit(
    [this, &out](const auto& node) -> std::error_code {
      using T = std::decay_t<decltype(node)>;
      if constexpr (std::is_same_v<T, Literal>) {
        out = node.value;
        return {};
      } else if constexpr (std::is_same_v<T, Identifier>) {
        return eval_identifier(node, out);
      } else if constexpr (std::is_same_v<T, Unary>) {
        return eval_unary(node, out);
      } else if constexpr (std::is_same_v<T, Binary>) {
        return eval_binary(node, out);
      } else {
        return eval_call(node, out);
      }
    },
    expr.node);
}

std::error_code Evaluator::eval_identifier(const Identifier& id, Value& out) const noexcept {
  out = Value{};
  if (id.path.empty()) {
    return {};
  }
  const Value* root = variables_.find(id.path.front());
  if (root == nullptr) {
    return {};
  }
  Path rest;
  for (std::size_t i = 1; i < id.path.size(); ++i) {
    rest.emplace_back(id.path[i]);
  }
  out = follow_path(*root, rest);
  return {};
}

std::error_code Evaluator::eval_unary(const Unary& u, Value& out) const noexcept {
  Value operand;
  if (auto ec = evaluate(*u.operand, operand)) {
    return ec;
  }
  if (u.op == UnaryOp::Not) {
    out = !truthy(operand);
    return {};
  }
  double d = 0.0;
  if (auto ec = to_number(operand, d)) {
    return ec;
  }
  out = -d;
  return {};
}

std::error_code Evaluator::eval_binary(const Binary& b, Value& out) const noexcept {
  Value lhs;
  if (auto ec = evaluate(*b.lhs, lhs)) {
    return ec;
  }

  // AND / OR 短路
  if (b.op == BinaryOp::And || b.op == BinaryOp::Or) {
    const bool l = truthy(lhs);
    if ((b.op == BinaryOp::And && !l) || (b.op == BinaryOp::Or && l)) {
      out = l;
      return {};
    }
    Value rhs;
    if (auto ec = evaluate(*b.rhs, rhs)) {
      return ec;
    }
    out = truthy(rhs);
    return {};
  }

  Value rhs;
  if (auto ec = evaluate(*b.rhs, rhs)) {
    return ec;
  }

  switch (b.op) {
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::Lt:
    case BinaryOp::Gt:
    case BinaryOp::Le:
    case BinaryOp::Ge:
      out = compare(b.op, lhs, rhs);
      return {};
    case BinaryOp::Concat:
      out = to_display_string(lhs) + to_display_string(rhs);
      return {};
    default:
      break;
  }

  double l = 0.0;
  double r = 0.0;
  if (auto ec = to_number(lhs, l)) {
    return ec;
  }
  if (auto ec = to_number(rhs, r)) {
    return ec;
  }
  switch (b.op) {
    case BinaryOp::Add: out = l + r; break;
    case BinaryOp::Sub: out = l - r; break;
    case BinaryOp::Mul: out = l * r; break;
    case BinaryOp::Div:
      if (r == 0.0) {
        return make_error_code(eval_errc::division_by_zero);
      }
      out = l / r;
      break;
    default:
      return make_error_code(eval_errc::invalid_operand);
  }
  return {};
}

std::error_code Evaluator::eval_call(const Call& call, Value& out) const noexcept {
  const auto& name = call.name;

  // IF 的分支按需求值
  if (name == "IF") {
    if (auto ec = arity(call, 2, 3)) {
      return ec;
    }
    Value cond;
    if (auto ec = evaluate(*call.args[0], cond)) {
      return ec;
    }
    if (truthy(cond)) {
      return evaluate(*call.args[1], out);
    }
    if (call.args.size() == 3) {
      return evaluate(*call.args[2], out);
    }
    out = false;
    return {};
  }

  std::vector<Value> args;
  args.reserve(call.args.size());
  for (const auto& a : call.args) {
    Value v;
    if (auto ec = evaluate(*a, v)) {
      return ec;
    }
    args.push_back(std::move(v));
  }

  if (name == "AND" || name == "OR") {
    if (auto ec = arity(call, 1, SIZE_MAX)) {
      return ec;
    }
    const bool want_all = name == "AND";
    bool result = want_all;
    for (const auto& v : args) {
      if (truthy(v) != want_all) {
        result = !want_all;
        break;
      }
    }
    out = result;
    return {};
  }
  if (name == "NOT") {
    if (auto ec = arity(call, 1, 1)) return ec;
    out = !truthy(args[0]);
    return {};
  }
  if (name == "TRUE" || name == "FALSE") {
    if (auto ec = arity(call, 0, 0)) return ec;
    out = name == "TRUE";
    return {};
  }
  if (name == "ISBLANK") {
    if (auto ec = arity(call, 1, 1)) return ec;
    out = is_blank(args[0]);
    return {};
  }
  if (name == "LEN") {
    if (auto ec = arity(call, 1, 1)) return ec;
    out = static_cast<double>(to_display_string(args[0]).size());
    return {};
  }
  if (name == "LOWER" || name == "UPPER" || name == "TRIM") {
    if (auto ec = arity(call, 1, 1)) return ec;
    const auto s = to_display_string(args[0]);
    out = name == "LOWER" ? lower(s) : (name == "UPPER" ? upper(s) : trim_spaces(s));
    return {};
  }
  if (name == "EXACT") {
    if (auto ec = arity(call, 2, 2)) return ec;
    out = to_display_string(args[0]) == to_display_string(args[1]);
    return {};
  }
  if (name == "CONTAINS") {
    if (auto ec = arity(call, 2, 2)) return ec;
    // 数组：是否含有相等元素；其余：不区分大小写的子串判断
    if (const auto* arr = args[0].get_if<Array>()) {
      out = std::any_of(arr->begin(), arr->end(),
                        [&](const Value& item) { return loose_equals(item, args[1]); });
      return {};
    }
    const auto haystack = lower(to_display_string(args[0]));
    const auto needle = lower(to_display_string(args[1]));
    out = haystack.find(needle) != std::string::npos;
    return {};
  }
  if (name == "SUM" || name == "MIN" || name == "MAX") {
    std::vector<double> nums;
    for (const auto& v : args) {
      if (auto ec = collect_numbers(v, nums)) {
        return ec;
      }
    }
    if (nums.empty()) {
      out = 0.0;
      return {};
    }
    if (name == "SUM") {
      double sum = 0.0;
      for (const double d : nums) {
        sum += d;
      }
      out = sum;
    } else if (name == "MIN") {
      out = *std::min_element(nums.begin(), nums.end());
    } else {
      out = *std::max_element(nums.begin(), nums.end());
    }
    return {};
  }
  if (name == "ABS") {
    if (auto ec = arity(call, 1, 1)) return ec;
    double d = 0.0;
    if (auto ec = to_number(args[0], d)) {
      return ec;
    }
    out = std::fabs(d);
    return {};
  }

  return make_error_code(eval_errc::unknown_function);
}

bool FormulaResult::syntax_error() const noexcept {
  return ec && (ec.category() == lexer_error_category() || ec.category() == parser_error_category());
}

FormulaResult evaluate_formula(std::string_view formula, const Object& variables) noexcept {
  FormulaResult result;
  if (formula.empty() || formula.front() != '=') {
    result.value = !formula.empty();
    return result;
  }

  auto parsed = parse(formula.substr(1));
  if (parsed.ec) {
    result.ec = parsed.ec;
    result.error_column = parsed.error_column;
    result.error_message = std::move(parsed.error_message);
    return result;
  }

  Value value;
  Evaluator evaluator(variables);
  if (auto ec = evaluator.evaluate(*parsed.expr, value)) {
    result.ec = ec;
    result.error_message = ec.message();
    return result;
  }
  result.value = truthy(value);
  return result;
}

}  // namespace pml::formula
