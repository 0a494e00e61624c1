#include "pml/components/utility.hpp"

#include "pml/component/schema.hpp"
#include "pml/render/context.hpp"

namespace pml::components {

namespace {

const Schema& no_props() {
  static const Schema kSchema{};
  return kSchema;
}

}  // namespace

const Schema* Hostname::schema() const noexcept { return &no_props(); }

Node Hostname::render(const Props&, const Value&, RenderContext& ctx) const {
  return ctx.env().runtime.hostname;
}

const Schema* Username::schema() const noexcept { return &no_props(); }

Node Username::render(const Props&, const Value&, RenderContext& ctx) const {
  return ctx.env().runtime.username;
}

const Schema* Cwd::schema() const noexcept { return &no_props(); }

Node Cwd::render(const Props&, const Value&, RenderContext& ctx) const { return ctx.env().runtime.cwd; }

const Schema* Timestamp::schema() const noexcept {
  static const Schema kSchema =
    Schema{}.optional("format", kind::string).one_of("format", Array{"iso", "date", "time", "unix"});
  return &kSchema;
}

Node Timestamp::render(const Props& props, const Value&, RenderContext& ctx) const {
  const auto& rt = ctx.env().runtime;
  const auto format = props.string_or("format", "iso");
  if (format == "date") {
    return rt.date;
  }
  if (format == "time") {
    return rt.time;
  }
  if (format == "unix") {
    return static_cast<double>(rt.timestamp);
  }
  return rt.date + "T" + rt.time;
}

}  // namespace pml::components
