#include "pml/formula/evaluator.hpp"
#include "pml/formula/parser.hpp"

#include "test_main.hpp"

#include <string>

namespace {

using pml::Array;
using pml::Object;
using pml::Value;
using pml::formula::BinaryOp;
using pml::formula::compare;
using pml::formula::eval_errc;
using pml::formula::evaluate_formula;
using pml::formula::Evaluator;
using pml::formula::make_error_code;

bool eval_bool(std::string_view formula, const Object& vars = {}) {
  return evaluate_formula(formula, vars).value;
}

Value eval_value(std::string_view src, const Object& vars = {}) {
  auto parsed = pml::formula::parse(src);
  Value out;
  if (parsed.ec) {
    return out;
  }
  Evaluator ev(vars);
  (void)ev.evaluate(*parsed.expr, out);
  return out;
}

void test_plain_strings_are_presence_checks() {
  TEST_EXPECT(eval_bool("anything"));
  TEST_EXPECT(!eval_bool(""));
  // 没有 '=' 前缀时不解析
  TEST_EXPECT(eval_bool("1 > 2"));
}

void test_arithmetic_and_concat() {
  TEST_EXPECT_EQ(eval_value("1 + 2 * 3"), Value(7));
  TEST_EXPECT_EQ(eval_value("(1 + 2) * 3"), Value(9));
  TEST_EXPECT_EQ(eval_value("10 / 4"), Value(2.5));
  TEST_EXPECT_EQ(eval_value("-2 - -3"), Value(1));
  TEST_EXPECT_EQ(eval_value("\"a\" & 1 & TRUE"), Value("a1true"));
  TEST_EXPECT_EQ(eval_value("\"4\" * 2"), Value(8));
  TEST_EXPECT_EQ(eval_value("missing + 1"), Value(1));
}

void test_comparisons() {
  const Object vars{{"age", 30}, {"name", "Ann"}, {"flag", true}};
  TEST_EXPECT(eval_bool("=age >= 18", vars));
  TEST_EXPECT(eval_bool("=age <> 31", vars));
  TEST_EXPECT(eval_bool("=name = \"ann\"", vars));
  TEST_EXPECT(eval_bool("=name < \"bob\"", vars));
  TEST_EXPECT(eval_bool("=flag = TRUE", vars));
  TEST_EXPECT(!eval_bool("=age < 18", vars));

  // 混合类型只支持相等判断
  TEST_EXPECT(!compare(BinaryOp::Eq, Value("1"), Value(1)));
  TEST_EXPECT(compare(BinaryOp::Ne, Value("1"), Value(1)));
  TEST_EXPECT(!compare(BinaryOp::Lt, Value("1"), Value(2)));
}

void test_blank_semantics() {
  // 缺失变量视为 blank：与数字比较时取 0，与字符串比较时取 ""
  TEST_EXPECT(eval_bool("=missing = 0"));
  TEST_EXPECT(eval_bool("=missing = \"\""));
  TEST_EXPECT(eval_bool("=missing < 1"));
  TEST_EXPECT(!eval_bool("=missing"));
  TEST_EXPECT(eval_bool("=NOT(missing)"));
  TEST_EXPECT(eval_bool("=ISBLANK(missing)"));
  TEST_EXPECT(!eval_bool("=ISBLANK(x)", Object{{"x", 0}}));
  TEST_EXPECT(eval_bool("=ISBLANK(x)", Object{{"x", nullptr}}));
  // 缺失的路径段同样是 blank，不报错
  const auto r = evaluate_formula("=user.profile.age > 3", Object{{"user", Object{}}});
  TEST_EXPECT(!r.value);
  TEST_EXPECT_OK(r.ec);
}

void test_logic() {
  const Object vars{{"a", true}, {"b", false}};
  TEST_EXPECT(eval_bool("=a AND NOT b", vars));
  TEST_EXPECT(eval_bool("=b OR a", vars));
  TEST_EXPECT(!eval_bool("=AND(a, b)", vars));
  TEST_EXPECT(eval_bool("=OR(b, b, a)", vars));
  TEST_EXPECT(eval_bool("=not b", vars));
  TEST_EXPECT(eval_bool("=TRUE()"));
  TEST_EXPECT(!eval_bool("=FALSE"));
  // 短路：右侧的除零不会被求值
  TEST_EXPECT(!eval_bool("=b AND 1/0", vars));
  TEST_EXPECT(eval_bool("=a OR 1/0", vars));
}

void test_functions() {
  const Object vars{{"name", "  Jane   Doe "}, {"tags", Array{"x", "Y"}}, {"scores", Array{3, 9, 1}}};
  TEST_EXPECT_EQ(eval_value("TRIM(name)", vars), Value("Jane Doe"));
  TEST_EXPECT_EQ(eval_value("UPPER(\"ab\")"), Value("AB"));
  TEST_EXPECT_EQ(eval_value("lower(\"AB\")"), Value("ab"));
  TEST_EXPECT_EQ(eval_value("LEN(TRIM(name))", vars), Value(8));
  TEST_EXPECT_EQ(eval_value("EXACT(\"a\", \"A\")"), Value(false));
  TEST_EXPECT_EQ(eval_value("CONTAINS(tags, \"y\")", vars), Value(true));
  TEST_EXPECT_EQ(eval_value("CONTAINS(\"Hello\", \"ELL\")"), Value(true));
  TEST_EXPECT_EQ(eval_value("SUM(scores, 2)", vars), Value(15));
  TEST_EXPECT_EQ(eval_value("MIN(scores)", vars), Value(1));
  TEST_EXPECT_EQ(eval_value("MAX(scores, missing)", vars), Value(9));
  TEST_EXPECT_EQ(eval_value("SUM()"), Value(0));
  TEST_EXPECT_EQ(eval_value("ABS(-4)"), Value(4));
  TEST_EXPECT_EQ(eval_value("IF(1 > 2, \"y\", \"n\")"), Value("n"));
  TEST_EXPECT_EQ(eval_value("IF(FALSE, 1)"), Value(false));
  // IF 只求值被选中的分支
  TEST_EXPECT_EQ(eval_value("IF(TRUE, 1, 1/0)"), Value(1));
}

void test_runtime_errors() {
  auto div = evaluate_formula("=1/0 > 0", {});
  TEST_EXPECT(!div.value);
  TEST_EXPECT_EQ(div.ec, make_error_code(eval_errc::division_by_zero));
  TEST_EXPECT(!div.syntax_error());

  auto unknown = evaluate_formula("=FOO(1)", {});
  TEST_EXPECT_EQ(unknown.ec, make_error_code(eval_errc::unknown_function));

  auto arity = evaluate_formula("=NOT(1, 2)", {});
  TEST_EXPECT_EQ(arity.ec, make_error_code(eval_errc::wrong_arity));

  auto operand = evaluate_formula("=\"abc\" * 2", {});
  TEST_EXPECT_EQ(operand.ec, make_error_code(eval_errc::invalid_operand));
}

void test_syntax_errors() {
  auto r = evaluate_formula("=a = = b", {});
  TEST_EXPECT(!r.value);
  TEST_EXPECT(r.syntax_error());
  TEST_EXPECT(!r.error_message.empty());

  auto lex = evaluate_formula("=a # b", {});
  TEST_EXPECT(lex.syntax_error());

  auto empty = evaluate_formula("=", {});
  TEST_EXPECT(empty.syntax_error());

  // 过深的嵌套按语法错误处理
  std::string deep = "=";
  for (int i = 0; i < 200000; ++i) {
    deep += "NOT(";
  }
  deep += "x";
  deep.append(200000, ')');
  auto nested = evaluate_formula(deep, {});
  TEST_EXPECT(!nested.value);
  TEST_EXPECT(nested.syntax_error());
}

}  // namespace

int main() {
  test_plain_strings_are_presence_checks();
  test_arithmetic_and_concat();
  test_comparisons();
  test_blank_semantics();
  test_logic();
  test_functions();
  test_runtime_errors();
  test_syntax_errors();
  return ::pml::tests::run_and_report();
}
