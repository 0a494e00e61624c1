#include "pml/component/component.hpp"
#include "pml/component/schema.hpp"
#include "pml/components/builtin.hpp"
#include "pml/element/builder.hpp"
#include "pml/render/renderer.hpp"

#include "test_main.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace {

using pml::Array;
using pml::Object;
using pml::Path;
using pml::render_errc;
using pml::RenderOptions;
using pml::Value;

const pml::Builder& h() {
  static const pml::Builder builder(pml::components::builtin_registry());
  return builder;
}

class Thrower final : public pml::Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Thrower"; }
  [[nodiscard]] pml::Node render(const pml::Props&, const Value&, pml::RenderContext&) const override {
    throw std::runtime_error("boom");
  }
};

class ThrowingResolve final : public pml::Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "ThrowingResolve"; }
  [[nodiscard]] bool has_resolve() const noexcept override { return true; }
  asio::awaitable<Value> resolve(const pml::Props&, pml::RenderContext&) const override {
    throw std::invalid_argument("bad input");
    co_return Value{};
  }
};

// 输出一个指向自身的延迟引用（由测试在构造后填入）
class SelfRef final : public pml::Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "SelfRef"; }
  [[nodiscard]] pml::Node render(const pml::Props&, const Value&, pml::RenderContext&) const override {
    return pml::ref(self.lock());
  }
  mutable std::weak_ptr<const pml::Element> self;
};

class Schemaless final : public pml::Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Schemaless"; }
  [[nodiscard]] pml::Node render(const pml::Props&, const Value&, pml::RenderContext&) const override {
    return "ok";
  }
};

// 输出 "[value]"
class Show final : public pml::Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Show"; }
  [[nodiscard]] pml::Node render(const pml::Props& props, const Value&, pml::RenderContext&) const override {
    return "[" + pml::to_display_string(props["value"]) + "]";
  }
};

void test_partial_failure_containment() {
  auto root = h().fragment({
    h()("Role", {}, {"be brief"}),
    h()("AskNumber", Object{{"name", "n"}}),
    h()("Task", {}, {"summarize"}),
  });
  auto result = pml::render(root);
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.errors.size(), 1U);
  if (!result.errors.empty()) {
    const auto& e = result.errors[0];
    TEST_EXPECT_EQ(e.component, "AskNumber");
    TEST_EXPECT(e.code == render_errc::missing_required);
    TEST_EXPECT(e.prop == std::optional<std::string>("label"));
    // 节点路径 + prop 名
    TEST_EXPECT(e.path == (Path{std::size_t{1}, "label"}));
  }
  TEST_EXPECT(result.text.find("be brief") != std::string::npos);
  TEST_EXPECT(result.text.find("summarize") != std::string::npos);
}

void test_invalid_props_fall_back_to_children() {
  auto root = h()("Constraint", Object{{"type", "maybe"}}, {"keep me"});
  auto result = pml::render(root);
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.text, "keep me");
  TEST_EXPECT(!result.errors.empty() && result.errors[0].code == render_errc::invalid_enum_value);
}

void test_runtime_errors_are_contained() {
  const pml::ComponentPtr thrower = std::make_shared<Thrower>();
  const pml::ComponentPtr throwing_resolve = std::make_shared<ThrowingResolve>();
  auto root = pml::fragment({
    "before ",
    pml::make_element(thrower, {}, {"fallback"}),
    pml::make_element(throwing_resolve, {}, {" second"}),
    " after",
  });
  auto result = pml::render(root);
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.text, "before fallback second after");
  TEST_EXPECT_EQ(result.errors.size(), 2U);
  if (result.errors.size() == 2) {
    TEST_EXPECT(result.errors[0].code == render_errc::runtime_error);
    TEST_EXPECT_EQ(result.errors[0].message, "Runtime error in Thrower: boom");
    TEST_EXPECT_EQ(result.errors[1].message, "Runtime error in ThrowingResolve: bad input");
  }
}

void test_unknown_component() {
  auto root = h().fragment({h()("Mystery", Object{{"x", 1}}, {"inner"}), "!"});
  auto result = pml::render(root);
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.text, "inner!");
  TEST_EXPECT(!result.errors.empty() && result.errors[0].code == render_errc::unknown_component);
  TEST_EXPECT(!result.errors.empty() && result.errors[0].component == "Mystery");
}

void test_circular_reference() {
  auto self_ref = std::make_shared<SelfRef>();
  const pml::ComponentPtr type = self_ref;
  auto el = pml::make_element(type, {}, {"child"});
  self_ref->self = el;

  auto result = pml::render(pml::fragment({"a", el, "b"}));
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.text, "ab");
  TEST_EXPECT(!result.errors.empty() && result.errors[0].code == render_errc::circular_reference);
}

void test_max_depth_fails_closed() {
  pml::Node node = "f";
  for (const char* letter : {"e", "d", "c", "b", "a"}) {
    node = pml::fragment({letter, node});
  }
  RenderOptions opts;
  opts.max_depth = 3;
  auto result = pml::render(node, opts);
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.text, "abc");
  TEST_EXPECT_EQ(result.errors.size(), 1U);
  TEST_EXPECT(!result.errors.empty() && result.errors[0].code == render_errc::max_depth_exceeded);

  // 默认上限足够正常文档使用
  TEST_EXPECT_EQ(pml::render(node).text, "abcdef");
}

void test_warnings() {
  auto no_task = h()("Prompt", Object{{"name", "p"}}, {h()("Role", Object{{"delimiter", "none"}}, {"r"})});

  auto plain = pml::render(no_task);
  TEST_EXPECT(plain.ok);
  TEST_EXPECT_EQ(plain.text, "r");
  TEST_EXPECT_EQ(plain.errors.size(), 1U);
  TEST_EXPECT(!plain.errors.empty() && plain.errors[0].is_warning());
  TEST_EXPECT(!plain.errors.empty() && plain.errors[0].code == render_errc::warn_missing_task);

  RenderOptions ignore;
  ignore.ignore_warnings = {render_errc::warn_missing_task};
  auto ignored = pml::render(no_task, ignore);
  TEST_EXPECT(ignored.ok);
  TEST_EXPECT(ignored.errors.empty());

  RenderOptions promote;
  promote.throw_on_warnings = true;
  auto promoted = pml::render(no_task, promote);
  TEST_EXPECT(!promoted.ok);
  TEST_EXPECT_EQ(promoted.errors.size(), 1U);

  // bare 或含 Task 时不告警
  auto bare = pml::render(h()("Prompt", Object{{"bare", true}}, {"x"}));
  TEST_EXPECT(bare.errors.empty());
  auto with_task = pml::render(h()("Prompt", {}, {h().fragment({h()("Task", {}, {"t"})})}));
  TEST_EXPECT(with_task.errors.empty());
}

void test_hard_errors_listed_before_warnings() {
  auto root = h()("Prompt", {}, {h()("AskText", Object{{"label", "missing name"}})});
  auto result = pml::render(root);
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.errors.size(), 2U);
  if (result.errors.size() == 2) {
    TEST_EXPECT(!result.errors[0].is_warning());
    TEST_EXPECT(result.errors[1].is_warning());
  }
}

void test_invalid_formula_warns() {
  auto result = pml::render(h()("If", Object{{"when", "=a = = b"}}, {"never"}));
  TEST_EXPECT(result.ok);
  TEST_EXPECT_EQ(result.text, "");
  TEST_EXPECT_EQ(result.errors.size(), 1U);
  if (!result.errors.empty()) {
    TEST_EXPECT(result.errors[0].code == render_errc::warn_invalid_formula);
    TEST_EXPECT(result.errors[0].prop == std::optional<std::string>("when"));
    TEST_EXPECT(result.errors[0].received == std::optional<Value>(Value("=a = = b")));
  }

  // 运行期错误（除零）只记日志
  auto runtime = pml::render(h()("If", Object{{"when", "=1/0 > 0"}}, {"never"}));
  TEST_EXPECT(runtime.ok);
  TEST_EXPECT(runtime.errors.empty());

  // 嵌套过深的条件同样只是告警
  std::string deep = "=";
  for (int i = 0; i < 50000; ++i) {
    deep += "(";
  }
  deep += "x";
  deep.append(50000, ')');
  auto nested = pml::render(h()("If", Object{{"when", deep}}, {"never"}));
  TEST_EXPECT(nested.ok);
  TEST_EXPECT_EQ(nested.errors.size(), 1U);
  TEST_EXPECT(!nested.errors.empty() && nested.errors[0].code == render_errc::warn_invalid_formula);
}

void test_failed_element_reported_once() {
  const pml::ComponentPtr show = std::make_shared<Show>();
  // 既被 props 引用又位于树中：校验错误只记录一次，两处都回退
  auto bad = h()("AskNumber", Object{{"name", "n"}}, {"kid"});
  auto result = pml::render(pml::fragment({pml::make_element(show, Object{{"value", bad}}), bad}));
  TEST_EXPECT(!result.ok);
  TEST_EXPECT_EQ(result.errors.size(), 1U);
  TEST_EXPECT_EQ(result.text, "[]kid");

  // ForEach 每次迭代复用同一个失败元素
  auto repeated = pml::render(h()("ForEach", Object{{"items", Array{1, 2, 3}}},
                                  {h()("AskNumber", Object{{"name", "n"}}, {"x"})}));
  TEST_EXPECT_EQ(repeated.errors.size(), 1U);
  TEST_EXPECT_EQ(repeated.text, "xxx");

  // 运行期失败同样只记录一次
  const pml::ComponentPtr thrower = std::make_shared<Thrower>();
  auto boom = pml::make_element(thrower, {}, {"f"});
  auto twice = pml::render(pml::fragment({boom, boom}));
  TEST_EXPECT_EQ(twice.errors.size(), 1U);
  TEST_EXPECT_EQ(twice.text, "ff");
}

void test_strict_schemas() {
  const pml::ComponentPtr schemaless = std::make_shared<Schemaless>();
  auto root = pml::fragment({pml::make_element(schemaless, {}, {"fallback"}), h()("Task", {}, {"t"})});

  auto lenient = pml::render(root);
  TEST_EXPECT(lenient.ok);
  TEST_EXPECT(lenient.text.find("ok") == 0);

  RenderOptions opts;
  opts.strict_schemas = true;
  auto strict = pml::render(root, opts);
  TEST_EXPECT(!strict.ok);
  TEST_EXPECT(strict.text.find("fallback") == 0);
  TEST_EXPECT_EQ(strict.errors.size(), 1U);
  TEST_EXPECT(!strict.errors.empty() && strict.errors[0].code == render_errc::missing_schema);

  // 内置组件都声明了 schema
  auto builtins = pml::render(h()("ForEach", Object{{"items", Array{1}}}), opts);
  TEST_EXPECT(builtins.ok);
}

void test_describe() {
  pml::RenderError e;
  e.component = "AskNumber";
  e.message = "required prop 'label' is missing";
  e.prop = "label";
  e.path = Path{std::size_t{0}, "label"};
  e.expected = "string";
  e.received = Value{};
  e.code = make_error_code(render_errc::missing_required);
  TEST_EXPECT_EQ(pml::describe(e),
                 "AskNumber: required prop 'label' is missing (prop=label, path=[0].label, expected=string, "
                 "received=undefined)");
  TEST_EXPECT_EQ(pml::render_errc_name(render_errc::warn_missing_task), "warn_missing_task");
  TEST_EXPECT(pml::is_warning(make_error_code(render_errc::warn_invalid_formula)));
  TEST_EXPECT(!pml::is_warning(make_error_code(render_errc::runtime_error)));
}

}  // namespace

int main() {
  test_partial_failure_containment();
  test_invalid_props_fall_back_to_children();
  test_runtime_errors_are_contained();
  test_unknown_component();
  test_circular_reference();
  test_max_depth_fails_closed();
  test_warnings();
  test_hard_errors_listed_before_warnings();
  test_invalid_formula_warns();
  test_failed_element_reported_once();
  test_strict_schemas();
  test_describe();
  return ::pml::tests::run_and_report();
}
