/**
 * @file render_example.cpp
 * @brief 演示如何构造提示词文档并渲染
 *
 * 本示例展示如何：
 * 1. 用 Builder 按名字构造元素树（内置组件目录）
 * 2. 用 AnswerQueue 作为答案来源（--interactive 时从标准输入读取）
 * 3. 读取渲染结果：文本、错误/告警、后续动作、元数据
 *
 * 用法：
 *   render_example [--format xml|markdown|text] [--verbose | --log-level <level>] [--interactive] [name=value ...]
 *
 * name=value 作为预置答案；--interactive 时其余问题逐个从标准输入读取。
 */

#include "pml/components/builtin.hpp"
#include "pml/core/log.hpp"
#include "pml/element/builder.hpp"
#include "pml/render/answer_queue.hpp"
#include "pml/render/metadata.hpp"
#include "pml/render/renderer.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

using namespace pml;

namespace {

ElementPtr build_review_prompt(const Builder& h) {
  return h("Prompt",
           Object{{"name", "code-review"}, {"version", "1.0.0"}, {"tags", Array{"review", "example"}}},
           {
             h("Role", {}, {"You are a careful reviewer of ", h("AskSelect", Object{{"name", "lang"},
                                                                                    {"label", "Language"},
                                                                                    {"options", Array{"C++", "Go", "Rust"}},
                                                                                    {"default", "C++"}}),
                             " code."}),
             h("Context", {}, {"Working directory: ", h("Cwd", {}), "\nDate: ", h("Timestamp", Object{{"format", "date"}})}),
             h("Task", {}, {"Review the change in ", h("AskText", Object{{"name", "file"}, {"label", "File to review"},
                                                                          {"default", "src/main.cpp"}}),
                            "."}),
             h("AskConfirm", Object{{"name", "strict"}, {"label", "Strict review?"}, {"silent", true}}),
             h("If", Object{{"when", "=strict"}},
               {h("Constraint", Object{{"type", "must"}}, {"Flag every unchecked error return."})}),
             h("Format", Object{{"type", "markdown list"}}),
             h("ReviewFile", Object{{"file", "review.md"}}),
           });
}

void print_action(const PostExecutionAction& action) {
  std::visit(
    [](const auto& a) {
      using T = std::decay_t<decltype(a)>;
      if constexpr (std::is_same_v<T, pml::ReviewFile>) {
        std::cout << "  review file: " << a.file << "\n";
      } else if constexpr (std::is_same_v<T, pml::OpenUrl>) {
        std::cout << "  open url: " << a.url << "\n";
      } else {
        std::cout << "  run command: " << a.command << "\n";
      }
    },
    action);
}

}  // namespace

int main(int argc, char** argv) {
  RenderOptions options;
  bool interactive = false;
  auto queue = std::make_shared<AnswerQueue>();

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--format" && i + 1 < argc) {
      const auto format = parse_output_format(argv[++i]);
      if (!format) {
        std::cerr << "unknown format: " << argv[i] << "\n";
        return 2;
      }
      options.format = *format;
    } else if (arg == "--verbose") {
      core::set_log_level(core::LogLevel::debug);
    } else if (arg == "--log-level" && i + 1 < argc) {
      const auto level = core::parse_log_level(argv[++i]);
      if (!level) {
        std::cerr << "unknown log level: " << argv[i] << "\n";
        return 2;
      }
      core::set_log_level(*level);
    } else if (arg == "--interactive") {
      interactive = true;
    } else if (const auto eq = arg.find('='); eq != std::string_view::npos) {
      options.answers.set(std::string(arg.substr(0, eq)), Value(std::string(arg.substr(eq + 1))));
    } else {
      std::cerr << "usage: render_example [--format xml|markdown|text] [--verbose | --log-level <level>] "
                   "[--interactive] [name=value ...]\n";
      return 2;
    }
  }

  if (interactive) {
    // 在挂起的 async_answer 内同步读取一行并投递
    queue->on_request([&queue](const InputRequirement& r) {
      std::cout << r.label;
      if (r.default_value) {
        std::cout << " [" << to_display_string(*r.default_value) << "]";
      }
      std::cout << ": " << std::flush;
      std::string line;
      if (std::getline(std::cin, line) && !line.empty()) {
        queue->supply(r.name, Value(line));
      } else {
        queue->cancel();
      }
    });
    options.answer_provider = queue;
  }

  const Builder h(components::builtin_registry());
  const auto doc = build_review_prompt(h);

  if (const auto meta = extract_metadata(doc)) {
    std::cout << "# " << meta->name;
    if (meta->version) {
      std::cout << " v" << *meta->version;
    }
    std::cout << "\n\n";
  }

  const auto result = render(doc, options);
  std::cout << result.text << "\n";

  if (!result.errors.empty()) {
    std::cout << "\n" << result.errors.size() << " problem(s):\n";
    for (const auto& e : result.errors) {
      std::cout << "  " << (e.is_warning() ? "warning " : "error ") << describe(e) << "\n";
    }
  }
  if (!result.post_execution.empty()) {
    std::cout << "\nafter rendering:\n";
    for (const auto& action : result.post_execution) {
      print_action(action);
    }
  }
  return result.ok ? 0 : 1;
}
