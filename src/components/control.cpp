#include "pml/components/control.hpp"

#include "pml/component/schema.hpp"
#include "pml/formula/evaluator.hpp"
#include "pml/render/context.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace pml::components {

namespace {

// provider 可以是单个名字或名字数组。
bool provider_matches(const Value& wanted, std::string_view provider) {
  if (const auto s = wanted.as_string()) {
    return *s == provider;
  }
  if (const auto* arr = wanted.get_if<Array>()) {
    for (const auto& item : *arr) {
      if (const auto s = item.as_string(); s && *s == provider) {
        return true;
      }
    }
  }
  return false;
}

bool evaluate_when(const Value& when, RenderContext& ctx) {
  if (when.is_undefined()) {
    return true;
  }
  const auto s = when.as_string();
  if (!s) {
    return truthy(when);
  }

  const auto result = formula::evaluate_formula(*s, ctx.answers());
  if (result.syntax_error()) {
    RenderError e;
    e.component = "If";
    e.prop = "when";
    e.message = "invalid formula '" + std::string(*s) + "': " + result.error_message +
                " (column " + std::to_string(result.error_column) + ")";
    e.code = make_error_code(render_errc::warn_invalid_formula);
    e.received = when;
    ctx.add_error(std::move(e));
  } else if (result.ec) {
    core::detail::logger().debug("formula '{}' evaluated to false: {}", *s, result.ec.message());
  }
  return result.value;
}

// ForEach 的单次迭代：绑定 answers[as] = item，输出子节点。
class ForEachItem final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "ForEachItem"; }

  [[nodiscard]] const Schema* schema() const noexcept override {
    static const Schema kSchema = Schema{}.required("as", kind::string).optional("item", kind::any);
    return &kSchema;
  }

  [[nodiscard]] Node render(const Props& props, const Value&, RenderContext&) const override {
    if (props.children().empty()) {
      return Array{to_display_string(props["item"]), "\n"};
    }
    return props.children();
  }

  [[nodiscard]] Object bindings(const Props& props) const override {
    Object out;
    if (const auto as = props["as"].as_string()) {
      out.set(std::string(*as), props["item"]);
    }
    return out;
  }
};

const ComponentPtr& for_each_item() {
  static const ComponentPtr kItem = std::make_shared<const ForEachItem>();
  return kItem;
}

}  // namespace

const Schema* If::schema() const noexcept {
  static const Schema kSchema = Schema{}
                                  .optional("when", kind::any)
                                  .optional("provider", kind::string | kind::array)
                                  .items("provider", kind::string)
                                  .optional("notProvider", kind::string | kind::array)
                                  .items("notProvider", kind::string);
  return &kSchema;
}

Node If::render(const Props& props, const Value&, RenderContext& ctx) const {
  const bool has_provider = props.has("provider");
  const bool has_not_provider = props.has("notProvider");

  if (has_provider || has_not_provider) {
    const auto& current = ctx.env().llm.provider;
    if (has_provider && !provider_matches(props["provider"], current)) {
      return Value{};
    }
    if (has_not_provider && provider_matches(props["notProvider"], current)) {
      return Value{};
    }
    return props.children();
  }

  if (!evaluate_when(props["when"], ctx)) {
    return Value{};
  }
  return props.children();
}

const Schema* ForEach::schema() const noexcept {
  static const Schema kSchema = Schema{}.required("items", kind::array).optional("as", kind::string);
  return &kSchema;
}

Node ForEach::render(const Props& props, const Value&, RenderContext&) const {
  const auto* items = props["items"].get_if<Array>();
  if (items == nullptr) {
    return Value{};
  }
  const auto as = props.string_or("as", "item");

  Array out;
  out.reserve(items->size());
  for (const auto& item : *items) {
    out.push_back(make_element(for_each_item(), Object{{"as", as}, {"item", item}}, props.children()));
  }
  return out;
}

}  // namespace pml::components
