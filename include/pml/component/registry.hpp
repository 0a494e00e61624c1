#pragma once

#include "pml/element/element.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace pml {

// 名字 -> 组件的只读查询接口（Builder 与渲染上下文只依赖它）。
class ComponentLookup {
 public:
  virtual ~ComponentLookup() = default;
  [[nodiscard]] virtual ComponentPtr lookup(std::string_view name) const = 0;
};

/**
 * @brief 组件目录。
 *
 * 说明：
 * - key 为组件名（区分大小写），与 Component::name() 一致；
 * - add() 不覆盖已有条目（返回 already_registered），set() 覆盖；
 * - add() 拒绝空指针、缺 brand 的对象与空名字（invalid_argument / not_a_component / empty_name）；
 * - 内部用互斥锁保护，lookup 返回 shared_ptr 拷贝，调用方不持锁使用组件。
 */
class ComponentRegistry final : public ComponentLookup {
 public:
  ComponentRegistry() = default;

  [[nodiscard]] std::error_code add(ComponentPtr component);
  void set(ComponentPtr component);
  void erase(std::string_view name) noexcept;
  void clear() noexcept;

  [[nodiscard]] ComponentPtr lookup(std::string_view name) const override;
  [[nodiscard]] bool contains(std::string_view name) const;
  [[nodiscard]] std::size_t size() const;
  // 按字典序排列。
  [[nodiscard]] std::vector<std::string> names() const;

 private:
  mutable std::mutex mu_{};
  std::unordered_map<std::string, ComponentPtr> components_{};
};

}  // namespace pml
