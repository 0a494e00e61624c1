#include "pml/render/error.hpp"

namespace pml {

namespace {

class RenderErrorCategory : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "pml.render"; }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<render_errc>(ev)) {
      case render_errc::ok: return "success";
      case render_errc::invalid_type: return "invalid prop type";
      case render_errc::missing_required: return "missing required prop";
      case render_errc::too_small: return "value below minimum";
      case render_errc::too_big: return "value above maximum";
      case render_errc::invalid_enum_value: return "value not in allowed set";
      case render_errc::unrecognized_keys: return "unrecognized props";
      case render_errc::missing_schema: return "component has no schema";
      case render_errc::runtime_error: return "component failed at runtime";
      case render_errc::unknown_component: return "unknown component";
      case render_errc::circular_reference: return "circular element reference";
      case render_errc::max_depth_exceeded: return "maximum nesting depth exceeded";
      case render_errc::warn_missing_task: return "prompt has no task";
      case render_errc::warn_invalid_formula: return "invalid formula";
    }
    return "unknown render error";
  }
};

const RenderErrorCategory kRenderErrorCategory{};

}  // namespace

const std::error_category& render_error_category() noexcept { return kRenderErrorCategory; }

std::error_code make_error_code(render_errc e) noexcept {
  return {static_cast<int>(e), kRenderErrorCategory};
}

std::string_view render_errc_name(render_errc e) noexcept {
  switch (e) {
    case render_errc::ok: return "ok";
    case render_errc::invalid_type: return "invalid_type";
    case render_errc::missing_required: return "missing_required";
    case render_errc::too_small: return "too_small";
    case render_errc::too_big: return "too_big";
    case render_errc::invalid_enum_value: return "invalid_enum_value";
    case render_errc::unrecognized_keys: return "unrecognized_keys";
    case render_errc::missing_schema: return "missing_schema";
    case render_errc::runtime_error: return "runtime_error";
    case render_errc::unknown_component: return "unknown_component";
    case render_errc::circular_reference: return "circular_reference";
    case render_errc::max_depth_exceeded: return "max_depth_exceeded";
    case render_errc::warn_missing_task: return "warn_missing_task";
    case render_errc::warn_invalid_formula: return "warn_invalid_formula";
  }
  return "unknown";
}

bool is_warning(const std::error_code& ec) noexcept {
  return ec.category() == kRenderErrorCategory &&
         ec.value() >= static_cast<int>(render_errc::warn_missing_task);
}

std::string describe(const RenderError& error) {
  std::string out = error.component;
  out += ": ";
  out += error.message;

  std::string detail;
  auto append = [&detail](std::string_view key, std::string_view value) {
    if (!detail.empty()) {
      detail += ", ";
    }
    detail += key;
    detail += '=';
    detail += value;
  };
  if (error.prop) {
    append("prop", *error.prop);
  }
  if (!error.path.empty()) {
    append("path", path_to_string(error.path));
  }
  if (error.expected) {
    append("expected", *error.expected);
  }
  if (error.received) {
    append("received", error.received->kind_name());
  }
  if (!detail.empty()) {
    out += " (";
    out += detail;
    out += ')';
  }
  return out;
}

}  // namespace pml
