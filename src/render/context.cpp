#include "pml/render/context.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

namespace pml {

std::string Scope::path() const {
  if (parent == nullptr) {
    return name;
  }
  auto out = parent->path();
  if (!out.empty() && !name.empty()) {
    out += '.';
  }
  out += name;
  return out;
}

std::string Scope::qualified(std::string_view leaf) const {
  auto out = path();
  if (!out.empty() && !leaf.empty()) {
    out += '.';
  }
  out += leaf;
  return out;
}

RenderContext::RenderContext(EnvironmentContext env, Object answers)
    : env_(std::move(env)), answers_(std::move(answers)) {}

const Value* RenderContext::answer(std::string_view name) const noexcept {
  return answers_.find(name);
}

bool RenderContext::seed_answer(std::string_view name, Value value) {
  if (answers_.contains(name)) {
    return false;
  }
  answers_.set(std::string(name), std::move(value));
  return true;
}

std::string RenderContext::qualified(std::string_view name) const {
  if (scope_ == nullptr) {
    return std::string(name);
  }
  return scope_->qualified(name);
}

void RenderContext::add_error(RenderError error) {
  Path full = node_path_;
  full.insert(full.end(), error.path.begin(), error.path.end());
  error.path = std::move(full);
  if (error.is_warning()) {
    core::detail::logger().debug("render warning: {}", describe(error));
  } else {
    core::detail::logger().warn("render error: {}", describe(error));
  }
  errors_.push_back(std::move(error));
}

void RenderContext::add_warning(std::string component, render_errc code, std::string message) {
  RenderError e;
  e.component = std::move(component);
  e.message = std::move(message);
  e.code = make_error_code(code);
  add_error(std::move(e));
}

void RenderContext::add_action(PostExecutionAction action) {
  post_execution_.push_back(std::move(action));
}

void RenderContext::add_requirement(InputRequirement requirement) {
  requirements_.push_back(std::move(requirement));
}

}  // namespace pml
