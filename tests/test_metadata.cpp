#include "pml/components/builtin.hpp"
#include "pml/element/builder.hpp"
#include "pml/render/metadata.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using pml::Array;
using pml::Object;

const pml::Builder& h() {
  static const pml::Builder builder(pml::components::builtin_registry());
  return builder;
}

void test_full_metadata() {
  auto root = h()("Prompt",
                  Object{{"name", "code-review"},
                         {"description", "Review a diff"},
                         {"version", "1.2.0"},
                         {"tags", Array{"review", 3, "code"}}},
                  {h()("Task", {}, {"review"})});
  auto meta = pml::extract_metadata(root);
  TEST_EXPECT(meta.has_value());
  if (meta) {
    TEST_EXPECT_EQ(meta->name, "code-review");
    TEST_EXPECT(meta->description == std::optional<std::string>("Review a diff"));
    TEST_EXPECT(meta->version == std::optional<std::string>("1.2.0"));
    // 非字符串标签被跳过
    TEST_EXPECT(meta->tags == (std::vector<std::string>{"review", "code"}));
  }
}

void test_prompt_inside_fragment() {
  auto root = h().fragment({"\n", h()("Prompt", Object{{"name", "first"}}), h()("Prompt", Object{{"name", "second"}})});
  auto meta = pml::extract_metadata(root);
  TEST_EXPECT(meta.has_value() && meta->name == "first");
  TEST_EXPECT(meta.has_value() && !meta->description.has_value() && meta->tags.empty());
}

void test_absent_metadata() {
  TEST_EXPECT(!pml::extract_metadata(h()("Prompt", Object{{"description", "no name"}})).has_value());
  TEST_EXPECT(!pml::extract_metadata(h()("Task", Object{{"name", "t"}})).has_value());
  TEST_EXPECT(!pml::extract_metadata(pml::Node("plain")).has_value());
  // 只看根片段的直接子节点
  auto nested = h().fragment({h().fragment({h()("Prompt", Object{{"name", "deep"}})})});
  TEST_EXPECT(!pml::extract_metadata(nested).has_value());
}

}  // namespace

int main() {
  test_full_metadata();
  test_prompt_inside_fragment();
  test_absent_metadata();
  return ::pml::tests::run_and_report();
}
