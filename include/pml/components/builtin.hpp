#pragma once

#include "pml/component/registry.hpp"

#include <system_error>

namespace pml::components {

/**
 * @brief 把全部内置组件登记到 registry。
 *
 * 已存在同名但不同的组件时返回 already_registered（已登记的条目保留）。
 */
[[nodiscard]] std::error_code register_builtin_components(ComponentRegistry& registry);

// 进程内共享的只读内置目录（首次调用时构建）。
[[nodiscard]] const ComponentRegistry& builtin_registry();

}  // namespace pml::components
