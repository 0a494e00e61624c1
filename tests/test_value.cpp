#include "pml/element/element.hpp"
#include "pml/value/value.hpp"

#include "test_main.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace {

using pml::Array;
using pml::Null;
using pml::Object;
using pml::Path;
using pml::Undefined;
using pml::Value;

void test_truthiness() {
  TEST_EXPECT(!pml::truthy(Value{}));
  TEST_EXPECT(!pml::truthy(Value(nullptr)));
  TEST_EXPECT(!pml::truthy(Value(false)));
  TEST_EXPECT(!pml::truthy(Value(0)));
  TEST_EXPECT(!pml::truthy(Value(std::nan(""))));
  TEST_EXPECT(!pml::truthy(Value("")));
  TEST_EXPECT(pml::truthy(Value(true)));
  TEST_EXPECT(pml::truthy(Value(-1)));
  TEST_EXPECT(pml::truthy(Value("0")));
  TEST_EXPECT(pml::truthy(Value(Array{})));
  TEST_EXPECT(pml::truthy(Value(Object{})));
}

void test_number_formatting() {
  TEST_EXPECT_EQ(pml::format_number(1.0), "1");
  TEST_EXPECT_EQ(pml::format_number(-42.0), "-42");
  TEST_EXPECT_EQ(pml::format_number(0.5), "0.5");
  TEST_EXPECT_EQ(pml::format_number(std::numeric_limits<double>::infinity()), "Infinity");
  TEST_EXPECT_EQ(pml::format_number(std::nan("")), "NaN");
}

void test_display_string() {
  TEST_EXPECT_EQ(pml::to_display_string(Value{}), "");
  TEST_EXPECT_EQ(pml::to_display_string(Value(nullptr)), "");
  TEST_EXPECT_EQ(pml::to_display_string(Value(true)), "true");
  TEST_EXPECT_EQ(pml::to_display_string(Value(3)), "3");
  TEST_EXPECT_EQ(pml::to_display_string(Value(Array{"a", 1, false})), "a, 1, false");
  TEST_EXPECT_EQ(pml::to_display_string(Value(Object{{"k", "v"}})), "{\"k\":\"v\"}");
}

void test_json() {
  const Value v(Object{{"name", "x\"y"}, {"list", Array{1, 2}}, {"empty", Object{}}, {"none", nullptr}});
  TEST_EXPECT_EQ(pml::to_json(v), "{\"name\":\"x\\\"y\",\"list\":[1,2],\"empty\":{},\"none\":null}");
  TEST_EXPECT_EQ(pml::to_json(Value(Array{1}), 2), "[\n  1\n]");
  TEST_EXPECT_EQ(pml::to_json(Value(Object{{"a", true}}), 2), "{\n  \"a\": true\n}");
  TEST_EXPECT_EQ(pml::to_json(Value(std::numeric_limits<double>::infinity())), "null");
  TEST_EXPECT_EQ(pml::to_json(Value(Array{0.5, -3, Value{}})), "[0.5,-3,null]");
  TEST_EXPECT_EQ(pml::to_json(Value("tab\tbell\x01")), "\"tab\\tbell\\u0001\"");
  // 非法 UTF-8 不抛异常
  TEST_EXPECT_EQ(pml::to_json(Value(std::string("a\xff"))), "\"a\xef\xbf\xbd\"");
}

void test_object_keeps_insertion_order() {
  Object o;
  o.set("b", 1);
  o.set("a", 2);
  o.set("b", 3);
  TEST_EXPECT_EQ(o.size(), 2U);
  TEST_EXPECT_EQ(o.members()[0].key, "b");
  TEST_EXPECT_EQ(*o.find("b"), Value(3));
  TEST_EXPECT(o.erase("b"));
  TEST_EXPECT(!o.erase("b"));
  TEST_EXPECT(!o.contains("b"));
  TEST_EXPECT_EQ(o.size(), 1U);
}

void test_equality() {
  TEST_EXPECT(Value(1) == Value(1.0));
  TEST_EXPECT(Value("1") != Value(1));
  TEST_EXPECT(Value(Undefined{}) != Value(Null{}));
  // 对象相等不要求键顺序一致
  TEST_EXPECT(Value(Object{{"a", 1}, {"b", 2}}) == Value(Object{{"b", 2}, {"a", 1}}));
  TEST_EXPECT(Value(Array{1, 2}) != Value(Array{2, 1}));

  // 元素按身份比较
  auto a = pml::fragment({"x"});
  auto b = pml::fragment({"x"});
  TEST_EXPECT(Value(a) == Value(a));
  TEST_EXPECT(Value(a) != Value(b));
}

void test_follow_path() {
  const Value root(Object{{"user", Object{{"name", "ann"}, {"tags", Array{"x", "y"}}}}});
  TEST_EXPECT_EQ(pml::follow_path(root, Path{"user", "name"}), Value("ann"));
  TEST_EXPECT_EQ(pml::follow_path(root, Path{"user", "tags", std::size_t{1}}), Value("y"));
  TEST_EXPECT_EQ(pml::follow_path(root, Path{"user", "tags", "0"}), Value("x"));
  TEST_EXPECT_EQ(pml::follow_path(root, Path{"user", "name", "length"}), Value(3));
  TEST_EXPECT(pml::follow_path(root, Path{"user", "missing", "deeper"}).is_undefined());
  TEST_EXPECT(pml::follow_path(root, Path{"user", "tags", std::size_t{9}}).is_undefined());
  TEST_EXPECT_EQ(pml::follow_path(root, Path{}), root);
}

void test_path_to_string() {
  TEST_EXPECT_EQ(pml::path_to_string(Path{std::size_t{0}, std::size_t{2}, "props", "name"}), "[0][2].props.name");
  TEST_EXPECT_EQ(pml::path_to_string(Path{}), "");
}

void test_kind_names() {
  TEST_EXPECT_EQ(Value{}.kind_name(), "undefined");
  TEST_EXPECT_EQ(Value(2).kind_name(), "number");
  TEST_EXPECT_EQ(Value(Array{}).kind_name(), "array");
  TEST_EXPECT_EQ(Value(pml::fragment({})).kind_name(), "element");
}

}  // namespace

int main() {
  test_truthiness();
  test_number_formatting();
  test_display_string();
  test_json();
  test_object_keeps_insertion_order();
  test_equality();
  test_follow_path();
  test_path_to_string();
  test_kind_names();
  return ::pml::tests::run_and_report();
}
