// 作为独立模块编译的第二份库副本（符号默认隐藏）。
// 只导出下面几个 C 接口，供 test_cross_copy_identity 通过 dlopen 调用。

#include "pml/component/component.hpp"
#include "pml/components/builtin.hpp"
#include "pml/core/identity.hpp"
#include "pml/element/builder.hpp"
#include "pml/element/children.hpp"

#include <memory>
#include <string>

namespace {

// 只有 render，没有 resolve：跨副本不传递协程帧。
class Shout final : public pml::Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Shout"; }

  [[nodiscard]] pml::Node render(const pml::Props& props, const pml::Value&, pml::RenderContext&) const override {
    std::string out = pml::text_of(props.children());
    for (auto& c : out) {
      if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      }
    }
    return out + "!";
  }
};

const pml::ComponentPtr& shout() {
  static const pml::ComponentPtr kShout = std::make_shared<const Shout>();
  return kShout;
}

}  // namespace

// 返回 new 出来的 pml::ElementPtr*，由调用方 delete。
extern "C" PML_PROCESS_VISIBLE void* pml_shadow_make_document() {
  const pml::Builder h(pml::components::builtin_registry());
  auto doc = h("Prompt", pml::Object{{"name", "shadow"}},
               {h("Task", {}, {"shadow task"}), pml::make_element(shout(), {}, {"quiet"})});
  return new pml::ElementPtr(std::move(doc));
}

// 返回 new 出来的 pml::ComponentPtr*，由调用方 delete。
extern "C" PML_PROCESS_VISIBLE void* pml_shadow_component() { return new pml::ComponentPtr(shout()); }

extern "C" PML_PROCESS_VISIBLE bool pml_shadow_is_element(const void* element_ptr) {
  const auto* element = static_cast<const pml::ElementPtr*>(element_ptr);
  return pml::is_element(pml::Value(*element));
}

extern "C" PML_PROCESS_VISIBLE void* pml_shadow_registry() { return pml_identity_registry_v1(); }

extern "C" PML_PROCESS_VISIBLE int pml_shadow_claim(const char* key, const char* writer) {
  return pml::core::identity_registry().claim(key, writer).value();
}
