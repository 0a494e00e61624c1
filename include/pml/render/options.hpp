#pragma once

#include "pml/core/common.hpp"
#include "pml/render/context.hpp"
#include "pml/render/environment.hpp"
#include "pml/render/error.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pml {

class ComponentLookup;

struct RenderOptions {
  OutputFormat format{OutputFormat::xml};
  bool trim{true};
  std::string indent{std::string(core::kDefaultIndent)};
  std::size_t max_depth{core::kDefaultMaxDepth};

  // 预置答案（渲染过程中的默认值写入不会覆盖这些条目）。
  Object answers{};
  // format/trim/indent 以上面的字段为准，覆盖 env.output。
  EnvironmentContext env{};

  // 组件没有 schema 时记 missing_schema。
  bool strict_schemas{false};
  bool throw_on_warnings{false};
  std::vector<render_errc> ignore_warnings{};

  std::shared_ptr<AnswerProvider> answer_provider{};
  // 可选：供组件按名字查找其他组件。
  const ComponentLookup* registry{nullptr};
};

struct RenderResult {
  bool ok{true};
  std::string text{};
  std::vector<RenderError> errors{};
  std::vector<PostExecutionAction> post_execution{};
  std::vector<InputRequirement> requirements{};
  // 最终答案表（含本次写入的默认值），调用方可带入下一次渲染。
  Object answers{};
};

}  // namespace pml
