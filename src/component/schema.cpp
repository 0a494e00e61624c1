#include "pml/component/schema.hpp"

#include <utility>

namespace pml {

namespace {

RenderError make_issue(std::string_view component,
                       const std::string& prop,
                       render_errc code,
                       std::string message) {
  RenderError e;
  e.component = std::string(component);
  e.prop = prop;
  e.message = std::move(message);
  e.code = make_error_code(code);
  e.path = Path{prop};
  return e;
}

// 参与 min/max 比较的“大小”：数值本身、字符串长度、数组元素个数。
std::optional<double> measure(const Value& v) noexcept {
  if (const auto* d = v.get_if<double>()) {
    return *d;
  }
  if (const auto* s = v.get_if<std::string>()) {
    return static_cast<double>(s->size());
  }
  if (const auto* a = v.get_if<Array>()) {
    return static_cast<double>(a->size());
  }
  return std::nullopt;
}

std::string describe_allowed(const Array& allowed) {
  std::string out;
  for (std::size_t i = 0; i < allowed.size(); ++i) {
    if (i != 0) {
      out += " | ";
    }
    out += to_json(allowed[i]);
  }
  return out;
}

}  // namespace

KindMask kind_of(const Value& v) noexcept {
  switch (v.storage().index()) {
    case 1: return kind::null;
    case 2: return kind::boolean;
    case 3: return kind::number;
    case 4: return kind::string;
    case 5: return kind::array;
    case 6: return kind::object;
    case 7: return kind::element;
    default: return 0;
  }
}

std::string describe_kinds(KindMask mask) {
  if (mask == kind::any) {
    return "any";
  }
  static constexpr std::pair<KindMask, std::string_view> kNames[] = {
    {kind::string, "string"},   {kind::number, "number"}, {kind::boolean, "boolean"},
    {kind::array, "array"},     {kind::object, "object"}, {kind::element, "element"},
    {kind::null, "null"},
  };
  std::string out;
  for (const auto& [bit, name] : kNames) {
    if ((mask & bit) == 0) {
      continue;
    }
    if (!out.empty()) {
      out += " | ";
    }
    out += name;
  }
  return out;
}

FieldSpec& Schema::field_or_add_(std::string_view name) {
  for (auto& f : fields_) {
    if (f.name == name) {
      return f;
    }
  }
  fields_.push_back(FieldSpec{std::string(name)});
  return fields_.back();
}

Schema& Schema::required(std::string name, KindMask kinds) {
  auto& f = field_or_add_(name);
  f.kinds = kinds;
  f.required = true;
  return *this;
}

Schema& Schema::optional(std::string name, KindMask kinds) {
  auto& f = field_or_add_(name);
  f.kinds = kinds;
  f.required = false;
  return *this;
}

Schema& Schema::one_of(std::string_view name, Array allowed) {
  field_or_add_(name).allowed = std::move(allowed);
  return *this;
}

Schema& Schema::range(std::string_view name, std::optional<double> min, std::optional<double> max) {
  auto& f = field_or_add_(name);
  f.min = min;
  f.max = max;
  return *this;
}

Schema& Schema::items(std::string_view name, KindMask kinds) {
  field_or_add_(name).item_kinds = kinds;
  return *this;
}

Schema& Schema::strict(bool on) noexcept {
  strict_ = on;
  return *this;
}

Schema& Schema::refine(std::string prop, render_errc code, std::string message, Predicate check) {
  refinements_.push_back(Refinement{std::move(prop), code, std::move(message), std::move(check)});
  return *this;
}

const FieldSpec* Schema::field(std::string_view name) const noexcept {
  for (const auto& f : fields_) {
    if (f.name == name) {
      return &f;
    }
  }
  return nullptr;
}

std::vector<RenderError> Schema::validate(std::string_view component, const Object& props) const {
  std::vector<RenderError> issues;

  for (const auto& f : fields_) {
    const Value* v = props.find(f.name);
    if (v == nullptr || v->is_undefined()) {
      if (f.required) {
        auto e = make_issue(component, f.name, render_errc::missing_required,
                            "required prop '" + f.name + "' is missing");
        e.expected = describe_kinds(f.kinds);
        e.received = Value{};
        issues.push_back(std::move(e));
      }
      continue;
    }

    if ((kind_of(*v) & f.kinds) == 0) {
      auto e = make_issue(component, f.name, render_errc::invalid_type,
                          "prop '" + f.name + "' has wrong type");
      e.expected = describe_kinds(f.kinds);
      e.received = *v;
      issues.push_back(std::move(e));
      continue;
    }

    if (!f.allowed.empty()) {
      bool found = false;
      for (const auto& a : f.allowed) {
        if (a == *v) {
          found = true;
          break;
        }
      }
      if (!found) {
        auto e = make_issue(component, f.name, render_errc::invalid_enum_value,
                            "prop '" + f.name + "' is not one of the allowed values");
        e.expected = describe_allowed(f.allowed);
        e.received = *v;
        issues.push_back(std::move(e));
        continue;
      }
    }

    if (const auto size = measure(*v)) {
      if (f.min && *size < *f.min) {
        auto e = make_issue(component, f.name, render_errc::too_small,
                            "prop '" + f.name + "' is below " + format_number(*f.min));
        e.expected = ">= " + format_number(*f.min);
        e.received = *v;
        issues.push_back(std::move(e));
        continue;
      }
      if (f.max && *size > *f.max) {
        auto e = make_issue(component, f.name, render_errc::too_big,
                            "prop '" + f.name + "' is above " + format_number(*f.max));
        e.expected = "<= " + format_number(*f.max);
        e.received = *v;
        issues.push_back(std::move(e));
        continue;
      }
    }

    if (f.item_kinds != kind::any) {
      if (const auto* arr = v->get_if<Array>()) {
        for (std::size_t i = 0; i < arr->size(); ++i) {
          if ((kind_of((*arr)[i]) & f.item_kinds) != 0) {
            continue;
          }
          auto e = make_issue(component, f.name, render_errc::invalid_type,
                              "prop '" + f.name + "' item has wrong type");
          e.path.emplace_back(i);
          e.expected = describe_kinds(f.item_kinds);
          e.received = (*arr)[i];
          issues.push_back(std::move(e));
          break;
        }
      }
    }
  }

  if (strict_) {
    std::string unknown;
    for (const auto& m : props.members()) {
      if (field(m.key) != nullptr) {
        continue;
      }
      if (!unknown.empty()) {
        unknown += ", ";
      }
      unknown += m.key;
    }
    if (!unknown.empty()) {
      RenderError e;
      e.component = std::string(component);
      e.message = "unrecognized props: " + unknown;
      e.code = make_error_code(render_errc::unrecognized_keys);
      issues.push_back(std::move(e));
    }
  }

  if (issues.empty()) {
    for (const auto& r : refinements_) {
      if (r.check && !r.check(props)) {
        auto e = make_issue(component, r.prop, r.code, r.message);
        if (const auto* v = props.find(r.prop)) {
          e.received = *v;
        }
        issues.push_back(std::move(e));
      }
    }
  }
  return issues;
}

}  // namespace pml
