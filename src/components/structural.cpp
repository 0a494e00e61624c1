#include "pml/components/structural.hpp"

#include "pml/component/schema.hpp"
#include "pml/element/children.hpp"
#include "pml/render/context.hpp"
#include "pml/render/delimiter.hpp"

namespace pml::components {

namespace {

Array delimiter_values() { return Array{"xml", "markdown", "none"}; }

}  // namespace

const Schema* Prompt::schema() const noexcept {
  static const Schema kSchema = Schema{}
                                  .optional("name", kind::string)
                                  .optional("description", kind::string)
                                  .optional("version", kind::string)
                                  .optional("tags", kind::array)
                                  .items("tags", kind::string)
                                  .optional("bare", kind::boolean);
  return &kSchema;
}

Node Prompt::render(const Props& props, const Value&, RenderContext& ctx) const {
  if (!props.bool_or("bare", false) && !has_child_of_type(props.children(), "Task")) {
    ctx.add_warning("Prompt", render_errc::warn_missing_task,
                    "Prompt has no Task child. Consider adding a Task element to define the objective.");
  }
  return props.children();
}

std::optional<std::string> Prompt::scope(const Props& props) const {
  if (const auto n = props["name"].as_string(); n && !n->empty()) {
    return std::string(*n);
  }
  return std::nullopt;
}

const Schema* Wrapper::schema() const noexcept {
  static const Schema kSchema = Schema{}.optional("delimiter", kind::string).one_of("delimiter", delimiter_values());
  return &kSchema;
}

Node Wrapper::render(const Props& props, const Value&, RenderContext& ctx) const {
  return wrap_with_delimiter(content(props, ctx), tag(props), delimiter_for(props, ctx));
}

Node Wrapper::content(const Props& props, const RenderContext&) const { return props.children(); }

const Schema* Section::schema() const noexcept {
  static const Schema kSchema = Schema{}
                                  .optional("name", kind::string)
                                  .optional("title", kind::string)
                                  .optional("delimiter", kind::string)
                                  .one_of("delimiter", delimiter_values());
  return &kSchema;
}

std::string Section::tag(const Props& props) const {
  const auto n = props.string_or("name", "");
  return n.empty() ? std::string("section") : n;
}

Node Section::render(const Props& props, const Value&, RenderContext& ctx) const {
  const auto delimiter = delimiter_for(props, ctx);
  if (delimiter == Delimiter::markdown) {
    const auto title = props.string_or("title", "");
    if (!title.empty()) {
      return wrap_with_delimiter(props.children(), title, delimiter);
    }
  }
  return wrap_with_delimiter(props.children(), tag(props), delimiter);
}

std::optional<std::string> Section::scope(const Props& props) const {
  if (const auto n = props["name"].as_string(); n && !n->empty()) {
    return std::string(*n);
  }
  return std::nullopt;
}

const Schema* Constraint::schema() const noexcept {
  static const Schema kSchema = Schema{}
                                  .optional("type", kind::string)
                                  .one_of("type", Array{"must", "should", "must-not"})
                                  .optional("delimiter", kind::string)
                                  .one_of("delimiter", delimiter_values());
  return &kSchema;
}

Node Constraint::content(const Props& props, const RenderContext&) const {
  const auto type = props.string_or("type", "");
  std::string prefix;
  if (type == "must") {
    prefix = "MUST: ";
  } else if (type == "should") {
    prefix = "SHOULD: ";
  } else if (type == "must-not") {
    prefix = "MUST NOT: ";
  }
  if (prefix.empty()) {
    return props.children();
  }
  return Array{std::move(prefix), props.children()};
}

const Schema* Format::schema() const noexcept {
  static const Schema kSchema = Schema{}
                                  .optional("type", kind::string)
                                  .optional("delimiter", kind::string)
                                  .one_of("delimiter", delimiter_values());
  return &kSchema;
}

Node Format::content(const Props& props, const RenderContext&) const {
  const auto type = props.string_or("type", "");
  if (type.empty()) {
    return props.children();
  }
  if (props.children().empty()) {
    return "Output format: " + type;
  }
  return Array{"Output format: " + type + "\n", props.children()};
}

}  // namespace pml::components
