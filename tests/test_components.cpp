#include "pml/components/builtin.hpp"
#include "pml/components/data.hpp"
#include "pml/element/builder.hpp"
#include "pml/render/renderer.hpp"

#include "test_main.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using pml::Array;
using pml::Object;
using pml::OutputFormat;
using pml::render_errc;
using pml::RenderOptions;
using pml::Value;

const pml::Builder& h() {
  static const pml::Builder builder(pml::components::builtin_registry());
  return builder;
}

std::string text(const pml::Node& root, RenderOptions opts = {}) {
  auto result = pml::render(root, std::move(opts));
  TEST_EXPECT(result.ok);
  return result.text;
}

RenderOptions markdown() {
  RenderOptions opts;
  opts.format = OutputFormat::markdown;
  return opts;
}

void test_structural_xml() {
  TEST_EXPECT_EQ(text(h()("Role", {}, {"be nice"})), "<role>\nbe nice\n</role>");
  TEST_EXPECT_EQ(text(h()("Context", {}, {"ctx"})), "<context>\nctx\n</context>");
  TEST_EXPECT_EQ(text(h()("Section", Object{{"name", "rules"}}, {"body"})), "<rules>\nbody\n</rules>");
  TEST_EXPECT_EQ(text(h()("Section", {}, {"body"})), "<section>\nbody\n</section>");
  TEST_EXPECT_EQ(text(h()("Task", Object{{"delimiter", "none"}}, {"go"})), "go");

  auto doc = h()("Prompt", Object{{"name", "demo"}},
                 {h()("Role", {}, {"r"}), h()("Task", {}, {"t"})});
  TEST_EXPECT_EQ(text(doc), "<role>\nr\n</role>\n<task>\nt\n</task>");
}

void test_structural_markdown() {
  TEST_EXPECT_EQ(text(h()("Task", {}, {"x"}), markdown()), "## task\n\nx");
  TEST_EXPECT_EQ(text(h()("Section", Object{{"name", "n"}, {"title", "Notes"}}, {"body"}), markdown()),
                 "## Notes\n\nbody");
  // 显式 delimiter 优先于文档格式
  TEST_EXPECT_EQ(text(h()("Role", Object{{"delimiter", "xml"}}, {"r"}), markdown()), "<role>\nr\n</role>");

  RenderOptions plain;
  plain.format = OutputFormat::text;
  TEST_EXPECT_EQ(text(h()("Role", {}, {"r"}), plain), "r");
}

void test_constraint_and_format() {
  TEST_EXPECT_EQ(text(h()("Constraint", Object{{"type", "must"}}, {"be short"})),
                 "<constraint>\nMUST: be short\n</constraint>");
  TEST_EXPECT_EQ(text(h()("Constraint", Object{{"type", "should"}, {"delimiter", "none"}}, {"cite"})),
                 "SHOULD: cite");
  TEST_EXPECT_EQ(text(h()("Constraint", Object{{"type", "must-not"}, {"delimiter", "none"}}, {"lie"})),
                 "MUST NOT: lie");
  TEST_EXPECT_EQ(text(h()("Constraint", Object{{"delimiter", "none"}}, {"plain"})), "plain");

  TEST_EXPECT_EQ(text(h()("Format", Object{{"type", "json"}, {"delimiter", "none"}})), "Output format: json");
  TEST_EXPECT_EQ(text(h()("Format", Object{{"type", "json"}, {"delimiter", "none"}}, {"fields"})),
                 "Output format: json\nfields");
  TEST_EXPECT_EQ(text(h()("Format", {}, {"free"})), "<format>\nfree\n</format>");
}

void test_if_provider() {
  auto pick = h().fragment({
    h()("If", Object{{"provider", "anthropic"}}, {"A"}),
    h()("If", Object{{"provider", "openai"}}, {"O"}),
    h()("If", Object{{"notProvider", Array{"openai", "google"}}}, {"N"}),
    h()("If", Object{{"notProvider", Array{"anthropic"}}}, {"X"}),
  });
  TEST_EXPECT_EQ(text(pick), "AN");

  RenderOptions opts;
  opts.env.llm.provider = "openai";
  TEST_EXPECT_EQ(text(pick, opts), "OX");
}

void test_if_when_values() {
  auto root = h().fragment({
    h()("If", Object{{"when", true}}, {"t"}),
    h()("If", Object{{"when", false}}, {"f"}),
    h()("If", Object{{"when", "plain text"}}, {"s"}),
    h()("If", Object{{"when", ""}}, {"e"}),
    h()("If", {}, {"u"}),
    h()("If", Object{{"when", "=1 = 1"}}, {"1"}),
  });
  TEST_EXPECT_EQ(text(root), "tsu1");
}

void test_ask_number() {
  RenderOptions opts;
  opts.answers = Object{{"n", "7"}};
  auto result = pml::render(h()("AskNumber", Object{{"name", "n"}, {"label", "N"}}), opts);
  TEST_EXPECT_EQ(result.text, "7");
  TEST_EXPECT_EQ(result.requirements.size(), 1U);
  if (!result.requirements.empty()) {
    TEST_EXPECT_EQ(result.requirements[0].type, "number");
    TEST_EXPECT_EQ(result.requirements[0].description, "N");
  }

  auto below = pml::render(
    h()("AskNumber", Object{{"name", "n"}, {"label", "N"}, {"default", 3}, {"min", 5}}, {"fallback"}));
  TEST_EXPECT(!below.ok);
  TEST_EXPECT_EQ(below.text, "fallback");
  TEST_EXPECT(!below.errors.empty() && below.errors[0].code == render_errc::too_small);
  TEST_EXPECT(!below.errors.empty() && below.errors[0].prop == std::optional<std::string>("default"));

  auto above = pml::render(h()("AskNumber", Object{{"name", "n"}, {"label", "N"}, {"default", 9}, {"max", 5}}));
  TEST_EXPECT(!above.errors.empty() && above.errors[0].code == render_errc::too_big);

  auto wrong_type = pml::render(h()("AskNumber", Object{{"name", "n"}, {"label", "N"}, {"default", "x"}}));
  TEST_EXPECT(!wrong_type.errors.empty() && wrong_type.errors[0].code == render_errc::invalid_type);
}

void test_ask_select() {
  auto options = Array{Object{{"value", "s"}, {"label", "Small"}, {"text", "a small one"}}, "m"};
  auto result = pml::render(
    h()("AskSelect", Object{{"name", "size"}, {"label", "Size"}, {"options", options}, {"default", "s"}}));
  TEST_EXPECT(result.ok);
  TEST_EXPECT_EQ(result.text, "a small one");
  if (!result.requirements.empty()) {
    const auto& opts = result.requirements[0].options;
    TEST_EXPECT_EQ(opts.size(), 2U);
    TEST_EXPECT(opts.size() == 2 &&
                opts[1] == Value(Object{{"value", "m"}, {"label", "m"}, {"text", "m"}}));
    TEST_EXPECT_EQ(result.requirements[0].type, "select");
  }

  auto bad = pml::render(
    h()("AskSelect", Object{{"name", "size"}, {"label", "Size"}, {"options", Array{"a"}}, {"default", "z"}}));
  TEST_EXPECT(!bad.ok);
  TEST_EXPECT(!bad.errors.empty() && bad.errors[0].code == render_errc::invalid_enum_value);
}

void test_ask_multi_select_confirm_rating() {
  auto multi = h()("AskMultiSelect", Object{{"name", "langs"},
                                            {"label", "Languages"},
                                            {"options", Array{Object{{"value", "cpp"}, {"label", "C++"}}, "go"}},
                                            {"default", Array{"cpp", "go"}}});
  TEST_EXPECT_EQ(text(multi), "C++, go");

  auto confirm = h()("AskConfirm", Object{{"name", "ok"}, {"label", "OK?"}});
  TEST_EXPECT_EQ(text(confirm), "No");
  RenderOptions yes;
  yes.answers = Object{{"ok", "yes"}};
  TEST_EXPECT_EQ(text(confirm, yes), "Yes");

  auto rating = h()("AskRating", Object{{"name", "r"},
                                        {"label", "Rate"},
                                        {"default", 3},
                                        {"labels", Object{{"1", "Poor"}, {"3", "Good"}}}});
  auto result = pml::render(rating);
  TEST_EXPECT_EQ(result.text, "3 (Good)");
  if (!result.requirements.empty()) {
    TEST_EXPECT(result.requirements[0].min == std::optional<double>(1.0));
    TEST_EXPECT(result.requirements[0].max == std::optional<double>(5.0));
  }

  // 无默认值的评分显示占位符
  TEST_EXPECT_EQ(text(h()("AskRating", Object{{"name", "r"}, {"label", "Rate"}})), "{r}");
}

void test_ask_silent_and_placeholder() {
  auto root = h().fragment({
    h()("AskText", Object{{"name", "who"}, {"label", "Who"}, {"silent", true}, {"default", "me"}}),
    "[",
    h()("AskText", Object{{"name", "what"}, {"label", "What"}}),
    "]",
  });
  auto result = pml::render(root);
  TEST_EXPECT_EQ(result.text, "[{what}]");
  TEST_EXPECT(result.answers.find("who") != nullptr && *result.answers.find("who") == Value("me"));
}

void test_file() {
  const auto path = std::filesystem::temp_directory_path() / "pml_test_components.py";
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "print(1)";
  }

  TEST_EXPECT_EQ(text(h()("File", Object{{"path", path.string()}})),
                 "<!-- pml_test_components.py -->\n```python\nprint(1)\n```");
  TEST_EXPECT_EQ(text(h()("File", Object{{"path", path.string()}, {"language", "text"}})),
                 "<!-- pml_test_components.py -->\n```text\nprint(1)\n```");
  std::filesystem::remove(path);

  // 读取失败渲染为错误标记，不算渲染错误
  auto missing = pml::render(h()("File", Object{{"path", path.string()}}));
  TEST_EXPECT(missing.ok);
  TEST_EXPECT(missing.text.rfind("[Error reading file: ", 0) == 0);

  TEST_EXPECT_EQ(pml::components::language_for_extension(".rs"), "rust");
  TEST_EXPECT_EQ(pml::components::language_for_extension(".unknown"), "");
}

void test_code_and_json() {
  TEST_EXPECT_EQ(text(h()("Code", {}, {"let x = 1;"})), "```typescript\nlet x = 1;\n```");
  TEST_EXPECT_EQ(text(h()("Code", Object{{"language", "cpp"}, {"filename", "a.cpp"}}, {"int x;"})),
                 "<!-- a.cpp -->\n```cpp\nint x;\n```");

  RenderOptions go;
  go.env.code.language = "go";
  TEST_EXPECT_EQ(text(h()("Code", {}, {"x := 1"}), go), "```go\nx := 1\n```");

  TEST_EXPECT_EQ(text(h()("Json", Object{{"value", Object{{"a", 1}}}})), "{\n  \"a\": 1\n}");
  RenderOptions wide;
  wide.indent = "    ";
  TEST_EXPECT_EQ(text(h()("Json", Object{{"value", Array{true}}}), wide), "[\n    true\n]");
}

void test_post_execution_actions() {
  auto root = h().fragment({
    h()("ReviewFile", Object{{"file", "out.md"}, {"editor", "vim"}}),
    h()("OpenUrl", Object{{"url", "https://example.com"}}),
    h()("RunCommand", Object{{"command", "make"}, {"cwd", "/src"}, {"env", Object{{"JOBS", 4}}}}),
    "done",
  });
  auto result = pml::render(root);
  TEST_EXPECT(result.ok);
  TEST_EXPECT_EQ(result.text, "done");
  TEST_EXPECT_EQ(result.post_execution.size(), 3U);
  if (result.post_execution.size() == 3) {
    TEST_EXPECT(result.post_execution[0] == pml::PostExecutionAction(pml::ReviewFile{"out.md", "vim"}));
    TEST_EXPECT(result.post_execution[1] ==
                pml::PostExecutionAction(pml::OpenUrl{"https://example.com", std::nullopt}));
    const auto* run = std::get_if<pml::RunCommand>(&result.post_execution[2]);
    TEST_EXPECT(run != nullptr);
    if (run != nullptr) {
      TEST_EXPECT_EQ(run->command, "make");
      TEST_EXPECT(run->cwd == std::optional<std::string>("/src"));
      TEST_EXPECT(run->env.count("JOBS") == 1 && run->env.at("JOBS") == "4");
    }
  }

  auto missing = pml::render(h()("OpenUrl", {}));
  TEST_EXPECT(!missing.ok);
  TEST_EXPECT(missing.post_execution.empty());
}

void test_utility_components() {
  RenderOptions opts;
  opts.env.runtime.hostname = "box";
  opts.env.runtime.username = "ada";
  opts.env.runtime.cwd = "/work";
  opts.env.runtime.timestamp = 1700000000000;
  opts.env.runtime.date = "2023-11-14";
  opts.env.runtime.time = "22:13:20";

  auto root = h().fragment({
    h()("Username", {}), "@", h()("Hostname", {}), ":", h()("Cwd", {}), " ",
    h()("Timestamp", {}), " ",
    h()("Timestamp", Object{{"format", "date"}}), " ",
    h()("Timestamp", Object{{"format", "time"}}), " ",
    h()("Timestamp", Object{{"format", "unix"}}),
  });
  TEST_EXPECT_EQ(text(root, opts), "ada@box:/work 2023-11-14T22:13:20 2023-11-14 22:13:20 1700000000000");

  auto bad = pml::render(h()("Timestamp", Object{{"format", "rfc"}}), opts);
  TEST_EXPECT(!bad.ok);

  // 未覆盖时从进程环境补齐
  auto live = pml::render(h()("Timestamp", Object{{"format", "unix"}}));
  TEST_EXPECT(live.ok && !live.text.empty() && live.text != "0");
}

}  // namespace

int main() {
  test_structural_xml();
  test_structural_markdown();
  test_constraint_and_format();
  test_if_provider();
  test_if_when_values();
  test_ask_number();
  test_ask_select();
  test_ask_multi_select_confirm_rating();
  test_ask_silent_and_placeholder();
  test_file();
  test_code_and_json();
  test_post_execution_actions();
  test_utility_components();
  return ::pml::tests::run_and_report();
}
