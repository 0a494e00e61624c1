#include "pml/render/renderer.hpp"

#include "pml/component/component.hpp"
#include "pml/component/schema.hpp"
#include "pml/element/element.hpp"

#include "core/log_internal.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace pml {

/*
 * RenderSession 的实现要点：
 *
 * - resolved_ 按 Element 地址记忆解析值：有 resolve 的组件在 resolve 后写入，
 *   其余组件在渲染完成后写入 undefined。同一元素无论被 props 引用几次、在树中
 *   出现几次（含 ForEach 的每次迭代），校验与 resolve 只执行一次；再次出现时
 *   以记忆值重新调用 render。
 * - failed_ 记录校验或执行失败的元素，再次出现时只回退到子节点，不重复记错。
 * - active_ 记录正在执行流水线的元素；再次进入即为循环引用。
 * - depth_ 统计元素嵌套层数（含经由 props 引用进入的层级），超过上限即放弃该子树。
 */
class RenderSession final {
 public:
  RenderSession(RenderContext& ctx, std::size_t max_depth) noexcept : ctx_(ctx), max_depth_(max_depth) {}

  asio::awaitable<std::string> render_node(const Node& node);

 private:
  asio::awaitable<std::string> render_children(const Array& children);
  asio::awaitable<std::string> render_element(const ElementPtr& element);
  asio::awaitable<std::string> render_component(const ElementPtr& element, const Component& component);
  asio::awaitable<std::string> render_with_context(const Node& node, const Component& component, const Props& props);

  asio::awaitable<Value> materialize(const Value& value);
  asio::awaitable<Value> ensure_resolved(const ElementPtr& element);

  void record(const Element& element, render_errc code, std::string message);
  void mark_failed(const Element& element);

  // 进入/离开一个元素层级。
  struct DepthGuard {
    explicit DepthGuard(std::size_t& d) noexcept : depth(d) { ++depth; }
    ~DepthGuard() { --depth; }
    std::size_t& depth;
  };

  RenderContext& ctx_;
  std::size_t max_depth_;
  std::size_t depth_{0};
  std::unordered_map<const Element*, Value> resolved_{};
  std::unordered_set<const Element*> active_{};
  std::unordered_set<const Element*> failed_{};
};

void RenderSession::record(const Element& element, render_errc code, std::string message) {
  RenderError e;
  e.component = element.type_name();
  e.message = std::move(message);
  e.code = make_error_code(code);
  ctx_.add_error(std::move(e));
}

void RenderSession::mark_failed(const Element& element) {
  failed_.insert(&element);
  resolved_.try_emplace(&element, Value{});
}

asio::awaitable<std::string> RenderSession::render_node(const Node& node) {
  const auto& storage = node.storage();

  if (const auto* s = std::get_if<std::string>(&storage)) {
    co_return *s;
  }
  if (const auto* d = std::get_if<double>(&storage)) {
    co_return format_number(*d);
  }
  if (const auto* arr = std::get_if<Array>(&storage)) {
    co_return co_await render_children(*arr);
  }
  if (const auto* ref = std::get_if<DeferredRef>(&storage)) {
    if (!ref->element) {
      co_return std::string{};
    }
    const Value base = co_await ensure_resolved(ref->element);
    co_return to_display_string(follow_path(base, ref->path));
  }
  if (const auto* el = std::get_if<ElementPtr>(&storage)) {
    if (!*el || !is_branded_element(el->get())) {
      co_return std::string{};
    }
    co_return co_await render_element(*el);
  }
  // undefined / null / bool / 普通对象不产生文本
  co_return std::string{};
}

asio::awaitable<std::string> RenderSession::render_children(const Array& children) {
  std::string out;
  for (std::size_t i = 0; i < children.size(); ++i) {
    ctx_.node_path_.emplace_back(i);
    out += co_await render_node(children[i]);
    ctx_.node_path_.pop_back();
  }
  co_return out;
}

asio::awaitable<std::string> RenderSession::render_element(const ElementPtr& element) {
  if (depth_ >= max_depth_) {
    record(*element, render_errc::max_depth_exceeded,
           "nesting deeper than " + std::to_string(max_depth_) + " levels");
    co_return std::string{};
  }
  DepthGuard guard(depth_);

  const auto& type = element->type();

  if (std::holds_alternative<FragmentMarker>(type)) {
    co_return co_await render_children(element->children());
  }

  if (std::holds_alternative<TextMarker>(type)) {
    std::string out;
    if (const auto* v = element->props().find("value")) {
      out = to_display_string(co_await materialize(*v));
    }
    out += co_await render_children(element->children());
    co_return out;
  }

  if (const auto* unresolved = std::get_if<UnresolvedName>(&type)) {
    record(*element, render_errc::unknown_component,
           "unknown component type \"" + unresolved->name + "\"");
    co_return co_await render_children(element->children());
  }

  const Component* component = element->component();
  if (component == nullptr || !is_component_class(component)) {
    record(*element, render_errc::unknown_component, "element type is not a component");
    co_return co_await render_children(element->children());
  }

  if (active_.contains(element.get())) {
    record(*element, render_errc::circular_reference,
           "element references itself through its props or output");
    co_return std::string{};
  }
  active_.insert(element.get());
  std::string out = co_await render_component(element, *component);
  active_.erase(element.get());
  co_return out;
}

asio::awaitable<std::string> RenderSession::render_component(const ElementPtr& element,
                                                             const Component& component) {
  const std::string name(component.name());

  if (failed_.contains(element.get())) {
    co_return co_await render_children(element->children());
  }

  Object props;
  for (const auto& m : element->props().members()) {
    props.set(m.key, co_await materialize(m.value));
  }
  const Props view(props, element->children());

  std::optional<Value> memo;
  if (const auto it = resolved_.find(element.get()); it != resolved_.end()) {
    memo = it->second;
  }

  if (!memo) {
    if (const Schema* schema = component.schema()) {
      auto issues = schema->validate(name, props);
      if (!issues.empty()) {
        for (auto& issue : issues) {
          ctx_.add_error(std::move(issue));
        }
        mark_failed(*element);
        co_return co_await render_children(element->children());
      }
    } else if (ctx_.strict_schemas()) {
      record(*element, render_errc::missing_schema, "component " + name + " declares no schema");
      mark_failed(*element);
      co_return co_await render_children(element->children());
    }
  }

  // resolve 与 render 中抛出的异常在此捕获；catch 块内不能 co_await，
  // 因此先记下失败，再在外面回退到子节点。
  std::optional<std::string> failure;
  Node output;
  try {
    Value resolved;
    if (memo) {
      resolved = std::move(*memo);
    } else if (component.has_resolve()) {
      resolved = co_await component.resolve(view, ctx_);
      resolved_.insert_or_assign(element.get(), resolved);
    }
    output = component.render(view, resolved, ctx_);
  } catch (const std::exception& ex) {
    failure = ex.what();
  }

  if (failure) {
    RenderError e;
    e.component = name;
    e.message = "Runtime error in " + name + ": " + *failure;
    e.code = make_error_code(render_errc::runtime_error);
    ctx_.add_error(std::move(e));
    mark_failed(*element);
    co_return co_await render_children(element->children());
  }

  std::string out = co_await render_with_context(output, component, view);
  resolved_.try_emplace(element.get(), Value{});
  co_return out;
}

asio::awaitable<std::string> RenderSession::render_with_context(const Node& node,
                                                                const Component& component,
                                                                const Props& props) {
  // 作用域：只对子树可见
  const Scope* saved_scope = ctx_.scope_;
  std::optional<Scope> scope;
  if (auto scope_name = component.scope(props)) {
    scope.emplace(Scope{std::move(*scope_name), saved_scope});
    ctx_.scope_ = &*scope;
  }

  // 绑定：写入临时答案，子树结束后恢复
  std::vector<std::pair<std::string, std::optional<Value>>> saved_answers;
  const Object bindings = component.bindings(props);
  for (const auto& m : bindings.members()) {
    std::optional<Value> previous;
    if (const auto* v = ctx_.answers_.find(m.key)) {
      previous = *v;
    }
    saved_answers.emplace_back(m.key, std::move(previous));
    ctx_.answers_.set(m.key, m.value);
  }

  std::string out = co_await render_node(node);

  for (auto it = saved_answers.rbegin(); it != saved_answers.rend(); ++it) {
    if (it->second) {
      ctx_.answers_.set(it->first, std::move(*it->second));
    } else {
      ctx_.answers_.erase(it->first);
    }
  }
  ctx_.scope_ = saved_scope;
  co_return out;
}

asio::awaitable<Value> RenderSession::materialize(const Value& value) {
  const auto& storage = value.storage();

  if (const auto* el = std::get_if<ElementPtr>(&storage)) {
    if (!*el || !is_branded_element(el->get())) {
      co_return value;
    }
    co_return co_await ensure_resolved(*el);
  }
  if (const auto* ref = std::get_if<DeferredRef>(&storage)) {
    if (!ref->element) {
      co_return Value{};
    }
    const Value base = co_await ensure_resolved(ref->element);
    co_return follow_path(base, ref->path);
  }
  if (const auto* arr = std::get_if<Array>(&storage)) {
    Array out;
    out.reserve(arr->size());
    for (const auto& item : *arr) {
      out.push_back(co_await materialize(item));
    }
    co_return Value(std::move(out));
  }
  if (const auto* obj = std::get_if<Object>(&storage)) {
    Object out;
    for (const auto& m : obj->members()) {
      out.set(m.key, co_await materialize(m.value));
    }
    co_return Value(std::move(out));
  }
  co_return value;
}

asio::awaitable<Value> RenderSession::ensure_resolved(const ElementPtr& element) {
  if (const auto it = resolved_.find(element.get()); it != resolved_.end()) {
    co_return it->second;
  }
  if (active_.contains(element.get())) {
    record(*element, render_errc::circular_reference,
           "circular reference to " + element->type_name());
    co_return Value{};
  }

  // 执行完整流水线（含副作用），丢弃文本输出
  (void)co_await render_element(element);

  if (const auto it = resolved_.find(element.get()); it != resolved_.end()) {
    co_return it->second;
  }
  co_return Value{};
}

namespace {

std::string trim_copy(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
    ++b;
  }
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
    --e;
  }
  return std::string(s.substr(b, e - b));
}

/*
 * 渲染前预置交互组件的默认值（仅在没有 AnswerProvider 时执行）：
 * 使位于交互组件之前的条件也能看到默认值。带 name/label 字符串属性的组件
 * 视为交互组件；已有条目不覆盖。
 */
void preseed_defaults(const Node& node, RenderContext& ctx, std::size_t depth, std::size_t max_depth) {
  if (depth > max_depth) {
    return;
  }
  if (const auto* arr = node.get_if<Array>()) {
    for (const auto& child : *arr) {
      preseed_defaults(child, ctx, depth, max_depth);
    }
    return;
  }
  const auto* el = node.get_if<ElementPtr>();
  if (el == nullptr || !*el || !is_branded_element(el->get())) {
    return;
  }

  const auto& props = (*el)->props();
  const auto* name = props.find("name");
  const auto* label = props.find("label");
  const Component* component = (*el)->component();
  if (component != nullptr && is_component_class(component) && name != nullptr && label != nullptr &&
      name->is<std::string>() && label->is<std::string>()) {
    const auto& key = *name->get_if<std::string>();
    const auto* def = props.find("default");
    if (def != nullptr && !def->is_undefined() && !def->is_element() && !def->is_deferred()) {
      ctx.seed_answer(key, *def);
    } else if (auto implicit = component->implicit_default()) {
      ctx.seed_answer(key, std::move(*implicit));
    }
  }

  for (const auto& child : (*el)->children()) {
    preseed_defaults(child, ctx, depth + 1, max_depth);
  }
}

}  // namespace

asio::awaitable<RenderResult> async_render(Node root, RenderOptions options) {
  EnvironmentContext env = std::move(options.env);
  env.output.format = options.format;
  env.output.trim = options.trim;
  env.output.indent = options.indent;
  fill_runtime_defaults(env.runtime);

  RenderContext ctx(std::move(env), std::move(options.answers));
  ctx.set_answer_provider(options.answer_provider);
  ctx.set_registry(options.registry);
  ctx.set_strict_schemas(options.strict_schemas);

  core::detail::logger().debug("render start: format={} max_depth={}",
                               to_string(options.format), options.max_depth);

  if (ctx.answer_provider() == nullptr) {
    preseed_defaults(root, ctx, 0, options.max_depth);
  }

  RenderSession session(ctx, options.max_depth);
  std::string text = co_await session.render_node(root);

  RenderResult result;
  result.text = options.trim ? trim_copy(text) : std::move(text);

  // 硬错误在前、告警在后；按选项忽略或提升告警
  std::vector<RenderError> warnings;
  for (const auto& e : ctx.errors()) {
    if (!e.is_warning()) {
      result.errors.push_back(e);
      continue;
    }
    const auto code = static_cast<render_errc>(e.code.value());
    if (std::find(options.ignore_warnings.begin(), options.ignore_warnings.end(), code) !=
        options.ignore_warnings.end()) {
      continue;
    }
    if (options.throw_on_warnings) {
      result.errors.push_back(e);
    } else {
      warnings.push_back(e);
    }
  }
  result.ok = result.errors.empty();
  result.errors.insert(result.errors.end(), warnings.begin(), warnings.end());

  result.post_execution = ctx.post_execution();
  result.requirements = ctx.requirements();
  result.answers = ctx.answers();

  core::detail::logger().debug("render finish: ok={} errors={} chars={}",
                               result.ok, result.errors.size(), result.text.size());
  co_return result;
}

RenderResult render(const Node& root, RenderOptions options) {
  asio::io_context io;
  std::optional<RenderResult> result;
  std::exception_ptr failure;

  asio::co_spawn(io, async_render(root, std::move(options)),
                 [&](std::exception_ptr ep, RenderResult r) {
                   if (ep) {
                     failure = ep;
                     return;
                   }
                   result = std::move(r);
                 });
  io.run();

  if (failure) {
    std::rethrow_exception(failure);
  }
  return std::move(*result);
}

}  // namespace pml
