#include "pml/components/ask.hpp"

#include "pml/component/schema.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace pml::components {

namespace {

struct Choice {
  std::string value;
  std::string label;
  std::string text;
};

// 字符串选项或 {value, label, text} 对象选项。
std::vector<Choice> choices_of(const Value& options) {
  std::vector<Choice> out;
  const auto* arr = options.get_if<Array>();
  if (arr == nullptr) {
    return out;
  }
  for (const auto& opt : *arr) {
    if (const auto s = opt.as_string()) {
      out.push_back(Choice{std::string(*s), std::string(*s), std::string(*s)});
      continue;
    }
    const auto* obj = opt.get_if<Object>();
    if (obj == nullptr) {
      continue;
    }
    Choice c;
    if (const auto* v = obj->find("value")) {
      c.value = to_display_string(*v);
    }
    const auto* label = obj->find("label");
    c.label = label != nullptr && !label->is_nullish() ? to_display_string(*label) : c.value;
    const auto* text = obj->find("text");
    c.text = text != nullptr && !text->is_nullish() ? to_display_string(*text) : c.label;
    out.push_back(std::move(c));
  }
  return out;
}

Array options_array(const std::vector<Choice>& choices) {
  Array out;
  out.reserve(choices.size());
  for (const auto& c : choices) {
    out.push_back(Object{{"value", c.value}, {"label", c.label}, {"text", c.text}});
  }
  return out;
}

std::string choice_text(const std::vector<Choice>& choices, const std::string& value) {
  for (const auto& c : choices) {
    if (c.value == value) {
      return c.text;
    }
  }
  return value;
}

std::optional<double> parse_number(std::string_view s) {
  const std::string text(s);
  if (text.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double d = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return d;
}

Value to_number_value(const Value& answer) {
  if (answer.is<double>()) {
    return answer;
  }
  if (const auto s = answer.as_string()) {
    if (const auto d = parse_number(*s)) {
      return *d;
    }
  }
  return answer;
}

}  // namespace

Schema Ask::base_schema() {
  return Schema{}
    .required("name", kind::string)
    .required("label", kind::string)
    .optional("description", kind::string)
    .optional("required", kind::boolean)
    .optional("silent", kind::boolean);
}

asio::awaitable<Value> Ask::resolve(const Props& props, RenderContext& ctx) const {
  const auto key = props.string_or("name", "");

  InputRequirement requirement;
  requirement.name = key;
  requirement.label = props.string_or("label", "");
  requirement.description = props.string_or("description", requirement.label);
  requirement.type = std::string(input_type());
  requirement.required = props.bool_or("required", false);
  if (props.has("default")) {
    requirement.default_value = props["default"];
  }
  requirement.scope = ctx.scope() != nullptr ? ctx.scope()->path() : std::string{};
  describe(props, requirement);
  ctx.add_requirement(requirement);

  if (const auto* existing = ctx.answer(key)) {
    co_return coerce(*existing);
  }

  if (auto* provider = ctx.answer_provider()) {
    auto answer = co_await provider->async_answer(requirement);
    if (answer) {
      Value value = coerce(*answer);
      ctx.seed_answer(key, value);
      co_return value;
    }
  }

  std::optional<Value> fallback = props.has("default") ? std::optional<Value>(props["default"]) : implicit_default();
  if (fallback) {
    ctx.seed_answer(key, *fallback);
    co_return *fallback;
  }
  co_return Value{};
}

Node Ask::render(const Props& props, const Value& resolved, RenderContext&) const {
  if (props.bool_or("silent", false)) {
    return Value{};
  }
  if (is_placeholder(props, resolved)) {
    return "{" + props.string_or("name", "") + "}";
  }
  return display(props, resolved);
}

void Ask::describe(const Props&, InputRequirement&) const {}

Value Ask::coerce(const Value& answer) const { return answer; }

bool Ask::is_placeholder(const Props& props, const Value& value) const {
  if (value.is_nullish()) {
    return true;
  }
  const auto s = value.as_string();
  return s && s->empty() && !props.has("default");
}

std::string Ask::display(const Props&, const Value& value) const { return to_display_string(value); }

const Schema* AskText::schema() const noexcept {
  static const Schema kSchema = base_schema().optional("default", kind::string).optional("placeholder", kind::string);
  return &kSchema;
}

const Schema* AskNumber::schema() const noexcept {
  static const Schema kSchema = base_schema()
                                  .optional("default", kind::number)
                                  .optional("min", kind::number)
                                  .optional("max", kind::number)
                                  .refine("default", render_errc::too_small, "default is below min",
                                          [](const Object& p) {
                                            const auto* d = p.find("default");
                                            const auto* m = p.find("min");
                                            return d == nullptr || m == nullptr || !d->is<double>() ||
                                                   !m->is<double>() || *d->as_number() >= *m->as_number();
                                          })
                                  .refine("default", render_errc::too_big, "default is above max",
                                          [](const Object& p) {
                                            const auto* d = p.find("default");
                                            const auto* m = p.find("max");
                                            return d == nullptr || m == nullptr || !d->is<double>() ||
                                                   !m->is<double>() || *d->as_number() <= *m->as_number();
                                          });
  return &kSchema;
}

void AskNumber::describe(const Props& props, InputRequirement& requirement) const {
  requirement.min = props["min"].as_number();
  requirement.max = props["max"].as_number();
}

Value AskNumber::coerce(const Value& answer) const { return to_number_value(answer); }

const Schema* AskConfirm::schema() const noexcept {
  static const Schema kSchema = base_schema().optional("default", kind::boolean);
  return &kSchema;
}

Value AskConfirm::coerce(const Value& answer) const {
  if (const auto s = answer.as_string()) {
    const std::string v(*s);
    if (v == "y" || v == "Y" || v == "yes" || v == "Yes" || v == "true") {
      return true;
    }
    if (v == "n" || v == "N" || v == "no" || v == "No" || v == "false") {
      return false;
    }
  }
  return answer;
}

bool AskConfirm::is_placeholder(const Props&, const Value& value) const { return value.is_nullish(); }

std::string AskConfirm::display(const Props&, const Value& value) const { return truthy(value) ? "Yes" : "No"; }

const Schema* AskSelect::schema() const noexcept {
  static const Schema kSchema =
    base_schema()
      .optional("default", kind::string)
      .optional("options", kind::array)
      .items("options", kind::string | kind::object)
      .refine("default", render_errc::invalid_enum_value, "default is not one of the options",
              [](const Object& p) {
                const auto* d = p.find("default");
                const auto* o = p.find("options");
                if (d == nullptr || o == nullptr || d->is_undefined()) {
                  return true;
                }
                const auto choices = choices_of(*o);
                if (choices.empty()) {
                  return true;
                }
                const auto value = to_display_string(*d);
                for (const auto& c : choices) {
                  if (c.value == value) {
                    return true;
                  }
                }
                return false;
              });
  return &kSchema;
}

void AskSelect::describe(const Props& props, InputRequirement& requirement) const {
  requirement.options = options_array(choices_of(props["options"]));
}

std::string AskSelect::display(const Props& props, const Value& value) const {
  return choice_text(choices_of(props["options"]), to_display_string(value));
}

const Schema* AskMultiSelect::schema() const noexcept {
  static const Schema kSchema = base_schema()
                                  .optional("default", kind::array)
                                  .items("default", kind::string)
                                  .optional("options", kind::array)
                                  .items("options", kind::string | kind::object)
                                  .optional("min", kind::number)
                                  .optional("max", kind::number);
  return &kSchema;
}

void AskMultiSelect::describe(const Props& props, InputRequirement& requirement) const {
  requirement.options = options_array(choices_of(props["options"]));
  requirement.min = props["min"].as_number();
  requirement.max = props["max"].as_number();
}

bool AskMultiSelect::is_placeholder(const Props& props, const Value& value) const {
  if (value.is_nullish()) {
    return true;
  }
  const auto* arr = value.get_if<Array>();
  return arr != nullptr && arr->empty() && !props.has("default");
}

std::string AskMultiSelect::display(const Props& props, const Value& value) const {
  const auto* arr = value.get_if<Array>();
  if (arr == nullptr) {
    return to_display_string(value);
  }
  const auto choices = choices_of(props["options"]);
  std::string out;
  for (std::size_t i = 0; i < arr->size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += choice_text(choices, to_display_string((*arr)[i]));
  }
  return out;
}

const Schema* AskRating::schema() const noexcept {
  static const Schema kSchema = base_schema()
                                  .optional("default", kind::number)
                                  .optional("min", kind::number)
                                  .optional("max", kind::number)
                                  .optional("labels", kind::object);
  return &kSchema;
}

void AskRating::describe(const Props& props, InputRequirement& requirement) const {
  requirement.min = props.number_or("min", 1.0);
  requirement.max = props.number_or("max", 5.0);
}

Value AskRating::coerce(const Value& answer) const { return to_number_value(answer); }

bool AskRating::is_placeholder(const Props& props, const Value& value) const {
  if (value.is_nullish()) {
    return true;
  }
  const auto d = value.as_number();
  return d && *d == 0.0 && !props.has("default");
}

std::string AskRating::display(const Props& props, const Value& value) const {
  const auto text = to_display_string(value);
  if (const auto* labels = props["labels"].get_if<Object>()) {
    if (const auto* label = labels->find(text); label != nullptr && !label->is_nullish()) {
      return text + " (" + to_display_string(*label) + ")";
    }
  }
  return text;
}

}  // namespace pml::components
