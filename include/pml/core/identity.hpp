#pragma once

#include <string>
#include <string_view>
#include <system_error>

#if defined(__GNUC__) || defined(__clang__)
#define PML_PROCESS_VISIBLE __attribute__((visibility("default")))
#else
#define PML_PROCESS_VISIBLE
#endif

namespace pml::core {

/**
 * @brief 跨实例身份标识（brand）。
 *
 * 同一进程内可能同时加载本库的两份独立副本（例如宿主一份、插件内嵌一份）。
 * 两份副本的 typeid / 虚表 / 静态变量地址互不相同，因此“是否为 Element /
 * Component”的判断一律基于全局约定、带版本号的字符串 key，按值比较。
 */
inline constexpr std::string_view kElementBrand = "pml.element/v1";
inline constexpr std::string_view kComponentBrand = "pml.component/v1";

// 按值比较 brand；candidate 为空指针时返回 false。
[[nodiscard]] bool brand_matches(const char* candidate, std::string_view expected) noexcept;

/**
 * @brief 进程级 brand 注册表。
 *
 * 语义：
 * - 每个 key 在进程内只允许一个写者（writer）；同一 writer 重复声明视为成功；
 * - 不同 writer 声明同一 key 返回 errc::already_registered；
 * - 注册表实例通过 C 链接、默认可见性的访问函数取得：当宿主可执行文件导出
 *   该符号时，后加载的库副本会绑定到同一实例。
 */
class IdentityRegistry final {
 public:
  [[nodiscard]] std::error_code claim(std::string_view key, std::string_view writer);
  [[nodiscard]] std::string owner(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const;

  // 不透明存储，只在 identity.cpp 中定义；与外观对象同放在导出的存储块里。
  struct Impl;

 private:
  Impl* impl_() const;
};

// 取得进程级注册表（内部转发到 pml_identity_registry_v1()）。
[[nodiscard]] IdentityRegistry& identity_registry() noexcept;

}  // namespace pml::core

extern "C" PML_PROCESS_VISIBLE void* pml_identity_registry_v1();
