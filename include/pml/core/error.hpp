#pragma once

#include <system_error>

namespace pml::core {

/**
 * @brief 组件目录与身份登记表返回的错误码（错误域 "pml.core"）。
 *
 * 渲染期间的问题不走这里，而是收集为 RenderError（见 render/error.hpp）；
 * 这里只覆盖“登记”类接口：ComponentRegistry::add、IdentityRegistry::claim。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,    // 空指针、空 key 或空 writer
  already_registered = 2,  // 名字或 key 已被另一个对象/writer 占用
  not_a_component = 3,     // 对象没有携带组件 brand
  empty_name = 4,          // 组件 name() 为空
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace pml::core

namespace std {
template <>
struct is_error_code_enum<pml::core::errc> : true_type {};
}  // namespace std
