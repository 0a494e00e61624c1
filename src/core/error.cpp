#include "pml/core/error.hpp"

#include <string>

namespace pml::core {
namespace {

class registration_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "pml.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::already_registered:
        return "already registered";
      case errc::not_a_component:
        return "object is not a component class";
      case errc::empty_name:
        return "component name is empty";
    }
    return "unknown pml.core error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static const registration_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace pml::core
