#include "pml/render/delimiter.hpp"

#include "pml/component/component.hpp"
#include "pml/render/context.hpp"

#include <string>

namespace pml {

Node wrap_with_delimiter(Node content, std::string_view tag, Delimiter delimiter) {
  switch (delimiter) {
    case Delimiter::xml:
      return Array{"<" + std::string(tag) + ">\n", std::move(content), "\n</" + std::string(tag) + ">\n"};
    case Delimiter::markdown:
      return Array{"## " + std::string(tag) + "\n\n", std::move(content), "\n\n"};
    case Delimiter::none:
      break;
  }
  return Array{std::move(content), "\n"};
}

Delimiter delimiter_for(const Props& props, const RenderContext& ctx) {
  if (const auto s = props["delimiter"].as_string()) {
    if (const auto d = parse_delimiter(*s)) {
      return *d;
    }
  }
  return default_delimiter(ctx.env().output.format);
}

}  // namespace pml
