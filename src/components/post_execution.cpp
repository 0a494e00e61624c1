#include "pml/components/post_execution.hpp"

#include "pml/component/schema.hpp"
#include "pml/render/context.hpp"

namespace pml::components {

namespace {

std::optional<std::string> optional_string(const Props& props, std::string_view key) {
  if (const auto s = props[key].as_string()) {
    return std::string(*s);
  }
  return std::nullopt;
}

}  // namespace

const Schema* ReviewFile::schema() const noexcept {
  static const Schema kSchema = Schema{}.required("file", kind::string).optional("editor", kind::string);
  return &kSchema;
}

Node ReviewFile::render(const Props& props, const Value&, RenderContext& ctx) const {
  ctx.add_action(pml::ReviewFile{props.string_or("file", ""), optional_string(props, "editor")});
  return Value{};
}

const Schema* OpenUrl::schema() const noexcept {
  static const Schema kSchema = Schema{}.required("url", kind::string).optional("browser", kind::string);
  return &kSchema;
}

Node OpenUrl::render(const Props& props, const Value&, RenderContext& ctx) const {
  ctx.add_action(pml::OpenUrl{props.string_or("url", ""), optional_string(props, "browser")});
  return Value{};
}

const Schema* RunCommand::schema() const noexcept {
  static const Schema kSchema = Schema{}
                                  .required("command", kind::string)
                                  .optional("cwd", kind::string)
                                  .optional("env", kind::object);
  return &kSchema;
}

Node RunCommand::render(const Props& props, const Value&, RenderContext& ctx) const {
  pml::RunCommand action;
  action.command = props.string_or("command", "");
  action.cwd = optional_string(props, "cwd");
  if (const auto* env = props["env"].get_if<Object>()) {
    for (const auto& m : env->members()) {
      action.env.emplace(m.key, to_display_string(m.value));
    }
  }
  ctx.add_action(std::move(action));
  return Value{};
}

}  // namespace pml::components
