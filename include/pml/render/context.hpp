#pragma once

#include "pml/render/environment.hpp"
#include "pml/render/error.hpp"
#include "pml/value/value.hpp"

#include <asio/awaitable.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pml {

class ComponentLookup;

/**
 * @brief 命名作用域（链表，子作用域指向父作用域）。
 *
 * 由组件通过 Component::scope() 为其子树引入；只在子树渲染期间存活。
 */
struct Scope {
  std::string name;
  const Scope* parent{nullptr};

  // 从最外层到当前层，以 '.' 连接。
  [[nodiscard]] std::string path() const;
  // path() + "." + name；name 为空时等于 path()。
  [[nodiscard]] std::string qualified(std::string_view name) const;
};

struct ReviewFile {
  std::string file;
  std::optional<std::string> editor{};
  friend bool operator==(const ReviewFile&, const ReviewFile&) = default;
};

struct OpenUrl {
  std::string url;
  std::optional<std::string> browser{};
  friend bool operator==(const OpenUrl&, const OpenUrl&) = default;
};

struct RunCommand {
  std::string command;
  std::optional<std::string> cwd{};
  std::map<std::string, std::string> env{};
  friend bool operator==(const RunCommand&, const RunCommand&) = default;
};

// 渲染完成后由调用方执行的动作（本库只收集，不执行）。
using PostExecutionAction = std::variant<ReviewFile, OpenUrl, RunCommand>;

/**
 * @brief 交互组件声明的输入需求。
 *
 * type 取值：text / number / confirm / select / multiselect / rating。
 */
struct InputRequirement {
  std::string name;
  std::string label;
  std::string description{};
  std::string type{"text"};
  bool required{false};
  std::optional<Value> default_value{};
  std::optional<double> min{};
  std::optional<double> max{};
  Array options{};
  std::string scope{};
};

/**
 * @brief 外部答案来源（例如 CLI 交互、UI 表单、测试脚本）。
 *
 * 交互组件在 answers 中找不到自己的条目时调用；返回 nullopt 表示不提供，
 * 组件回退到默认值。
 */
class AnswerProvider {
 public:
  virtual ~AnswerProvider() = default;
  virtual asio::awaitable<std::optional<Value>> async_answer(const InputRequirement& requirement) = 0;
};

/**
 * @brief 单次渲染的上下文（每次渲染新建，渲染结束即丢弃）。
 *
 * 组件只能：
 * - 读取 env / scope / answers；
 * - 追加 errors / post_execution / requirements；
 * - 通过 seed_answer 写入“尚不存在”的答案。
 */
class RenderContext final {
 public:
  RenderContext(EnvironmentContext env, Object answers);

  [[nodiscard]] const EnvironmentContext& env() const noexcept { return env_; }

  [[nodiscard]] const Object& answers() const noexcept { return answers_; }
  [[nodiscard]] const Value* answer(std::string_view name) const noexcept;
  // 仅当 name 尚无条目时写入；返回是否写入。
  bool seed_answer(std::string_view name, Value value);

  [[nodiscard]] const Scope* scope() const noexcept { return scope_; }
  [[nodiscard]] std::string qualified(std::string_view name) const;

  [[nodiscard]] const std::vector<RenderError>& errors() const noexcept { return errors_; }
  // error.path 前自动加上当前节点路径。
  void add_error(RenderError error);
  void add_warning(std::string component, render_errc code, std::string message);

  [[nodiscard]] const std::vector<PostExecutionAction>& post_execution() const noexcept { return post_execution_; }
  void add_action(PostExecutionAction action);

  [[nodiscard]] const std::vector<InputRequirement>& requirements() const noexcept { return requirements_; }
  void add_requirement(InputRequirement requirement);

  [[nodiscard]] AnswerProvider* answer_provider() const noexcept { return answer_provider_.get(); }
  void set_answer_provider(std::shared_ptr<AnswerProvider> provider) noexcept { answer_provider_ = std::move(provider); }

  [[nodiscard]] const ComponentLookup* registry() const noexcept { return registry_; }
  void set_registry(const ComponentLookup* registry) noexcept { registry_ = registry; }

  [[nodiscard]] bool strict_schemas() const noexcept { return strict_schemas_; }
  void set_strict_schemas(bool on) noexcept { strict_schemas_ = on; }

  // 由渲染器在子树进出时维护。
  [[nodiscard]] const Path& node_path() const noexcept { return node_path_; }

 private:
  friend class RenderSession;

  EnvironmentContext env_;
  Object answers_;
  const Scope* scope_{nullptr};
  const ComponentLookup* registry_{nullptr};
  std::shared_ptr<AnswerProvider> answer_provider_{};
  std::vector<RenderError> errors_{};
  std::vector<PostExecutionAction> post_execution_{};
  std::vector<InputRequirement> requirements_{};
  Path node_path_{};
  bool strict_schemas_{false};
};

}  // namespace pml
