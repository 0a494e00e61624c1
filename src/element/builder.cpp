#include "pml/element/builder.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

namespace pml {

ElementPtr Builder::operator()(std::string_view name, Object props, Array children) const {
  if (name == "Fragment") {
    return make_element(TypeRef{FragmentMarker{}}, std::move(props), std::move(children));
  }
  if (name == "Text") {
    return make_element(TypeRef{TextMarker{}}, std::move(props), std::move(children));
  }
  if (auto component = lookup_.lookup(name)) {
    return make_element(std::move(component), std::move(props), std::move(children));
  }
  core::detail::logger().debug("builder: unknown component name '{}'", name);
  return make_element(TypeRef{UnresolvedName{std::string(name)}}, std::move(props), std::move(children));
}

}  // namespace pml
