#include "pml/components/builtin.hpp"

#include "pml/components/ask.hpp"
#include "pml/components/control.hpp"
#include "pml/components/data.hpp"
#include "pml/components/post_execution.hpp"
#include "pml/components/structural.hpp"
#include "pml/components/utility.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace pml::components {

namespace {

std::vector<ComponentPtr> make_builtins() {
  return {
    std::make_shared<Prompt>(),
    std::make_shared<Role>(),
    std::make_shared<Task>(),
    std::make_shared<Context>(),
    std::make_shared<Section>(),
    std::make_shared<Constraint>(),
    std::make_shared<Format>(),
    std::make_shared<If>(),
    std::make_shared<ForEach>(),
    std::make_shared<AskText>(),
    std::make_shared<AskNumber>(),
    std::make_shared<AskConfirm>(),
    std::make_shared<AskSelect>(),
    std::make_shared<AskMultiSelect>(),
    std::make_shared<AskRating>(),
    std::make_shared<File>(),
    std::make_shared<Code>(),
    std::make_shared<Json>(),
    std::make_shared<ReviewFile>(),
    std::make_shared<OpenUrl>(),
    std::make_shared<RunCommand>(),
    std::make_shared<Hostname>(),
    std::make_shared<Username>(),
    std::make_shared<Cwd>(),
    std::make_shared<Timestamp>(),
  };
}

}  // namespace

std::error_code register_builtin_components(ComponentRegistry& registry) {
  std::error_code first{};
  for (auto& component : make_builtins()) {
    const std::string name(component->name());
    if (auto ec = registry.add(std::move(component)); ec) {
      core::detail::logger().warn("builtin component '{}' not registered: {}", name, ec.message());
      if (!first) {
        first = ec;
      }
    }
  }
  return first;
}

const ComponentRegistry& builtin_registry() {
  static ComponentRegistry registry;
  static const bool populated = [] {
    return !register_builtin_components(registry);
  }();
  (void)populated;
  return registry;
}

}  // namespace pml::components
