#include "pml/core/identity.hpp"

#include "pml/core/error.hpp"

#include <cstring>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pml::core {

// 注册表的真实存储。IdentityRegistry 本身不含数据成员，所有状态都挂在
// pml_identity_registry_v1() 返回的同一块存储上，保证多副本共享时布局一致。
struct IdentityRegistry::Impl {
  mutable std::mutex mu{};
  std::unordered_map<std::string, std::string> owners{};
};

namespace {

struct RegistryStorage {
  IdentityRegistry facade{};
  IdentityRegistry::Impl impl{};
};

}  // namespace

bool brand_matches(const char* candidate, std::string_view expected) noexcept {
  if (candidate == nullptr) {
    return false;
  }
  return std::string_view(candidate) == expected;
}

IdentityRegistry::Impl* IdentityRegistry::impl_() const {
  auto* storage = static_cast<RegistryStorage*>(pml_identity_registry_v1());
  return &storage->impl;
}

std::error_code IdentityRegistry::claim(std::string_view key, std::string_view writer) {
  if (key.empty() || writer.empty()) {
    return make_error_code(errc::invalid_argument);
  }
  auto* impl = impl_();
  std::lock_guard lk(impl->mu);
  auto [it, inserted] = impl->owners.try_emplace(std::string(key), std::string(writer));
  if (!inserted && it->second != writer) {
    return make_error_code(errc::already_registered);
  }
  return {};
}

std::string IdentityRegistry::owner(std::string_view key) const {
  auto* impl = impl_();
  std::lock_guard lk(impl->mu);
  const auto it = impl->owners.find(std::string(key));
  if (it == impl->owners.end()) {
    return {};
  }
  return it->second;
}

bool IdentityRegistry::contains(std::string_view key) const {
  auto* impl = impl_();
  std::lock_guard lk(impl->mu);
  return impl->owners.find(std::string(key)) != impl->owners.end();
}

IdentityRegistry& identity_registry() noexcept {
  return static_cast<RegistryStorage*>(pml_identity_registry_v1())->facade;
}

}  // namespace pml::core

extern "C" void* pml_identity_registry_v1() {
  static pml::core::RegistryStorage storage;
  return &storage;
}
